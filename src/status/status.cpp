#include <cstdio>

#include "./status.hpp"

// indeterminate ticks are rendered as one step out of this many
#define INDETERMINATE_TOTAL 100

void update_status(StatusSink *sink, const update_status_t &status) {
    if (sink == nullptr) {
        return;
    }
    sink->update(status);
}

ConsoleStatusSink::ConsoleStatusSink(FILE *stream_) :
    stream {stream_},
    brief {},
    detail {},
    position {0},
    total {INDETERMINATE_TOTAL},
    determinate {false},
    dirty {false} {}

ConsoleStatusSink::~ConsoleStatusSink() {
    finish();
}

void ConsoleStatusSink::update(const update_status_t &status) {
    if (status.brief.has_value()) {
        brief = status.brief.value();
    }
    if (status.detail.has_value()) {
        detail = status.detail.value();
    }
    if (status.brief.has_value() && !status.total.has_value()) {
        // new phase without a known size
        determinate = false;
        total = INDETERMINATE_TOTAL;
        position = 0;
    }
    if (status.total.has_value()) {
        total = status.total.value();
        position = 0;
        determinate = true;
    }
    if (status.increment.has_value()) {
        if (!status.total.has_value() && !determinate) {
            position = (position + status.increment.value()) % INDETERMINATE_TOTAL;
        } else {
            position += status.increment.value();
            if (position > total) {
                // more ticks than announced, fall back to a spinning bar
                determinate = false;
                total = INDETERMINATE_TOTAL;
                position = position % INDETERMINATE_TOTAL;
            }
        }
    }
    render();
}

void ConsoleStatusSink::render() {
    if (determinate && total > 0) {
        fprintf(stream, "\r%s %llu/%llu (%llu%%) %s\x1b[K",
            brief.c_str(),
            (unsigned long long) position,
            (unsigned long long) total,
            (unsigned long long) (position * 100 / total),
            detail.c_str());
    } else {
        fprintf(stream, "\r%s [%llu] %s\x1b[K",
            brief.c_str(),
            (unsigned long long) position,
            detail.c_str());
    }
    fflush(stream);
    dirty = true;
}

void ConsoleStatusSink::finish() {
    if (!dirty) {
        return;
    }
    fprintf(stream, "\n");
    fflush(stream);
    dirty = false;
}
