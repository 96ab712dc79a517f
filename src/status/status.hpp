#pragma once

#include <cstdio>
#include <cstdint>
#include <string>
#include <optional>

// Sparse progress record. Absent fields mean "no change".
// An update without total is an indeterminate tick, an update with total
// resets the progress bar to that scale.
struct update_status_t {
    std::optional<std::string> brief;
    std::optional<std::string> detail;
    std::optional<uint64_t> increment;
    std::optional<uint64_t> total;
};

class StatusSink {
public:
    virtual ~StatusSink() = default;
    virtual void update(const update_status_t &status) = 0;
};

// forwards to sink, does nothing if sink is null
void update_status(StatusSink *sink, const update_status_t &status);

// Renders progress as a single updating line on a terminal stream.
class ConsoleStatusSink : public StatusSink {
public:
    explicit ConsoleStatusSink(FILE *stream_ = stderr);
    ~ConsoleStatusSink() override;

    void update(const update_status_t &status) override;
    // terminates the progress line
    void finish();

private:
    void render();

    FILE *stream;
    std::string brief;
    std::string detail;
    uint64_t position;
    uint64_t total;
    bool determinate;
    bool dirty;
};
