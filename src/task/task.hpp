#pragma once

#include <chrono>
#include <string>
#include <optional>
#include <system_error>
#include <future>
#include <thread>
#include <variant>
#include <exception>
#include <functional>

#include "../error/error.hpp"
#include "../status/status.hpp"

// how often a waiting caller checks the task and emits a progress tick
#define TASK_POLL_INTERVAL_MS 50

// Runs a blocking operation on its own thread.
// The operation reports ordinary failures through archive_error_t. If it throws
// instead, or if no thread could be started for it, join() reports ERROR_TASK_FAILURE.
// NOTE: there is no cancellation. Destroying a task that was not joined waits
// for the operation to run to completion.
template<class T>
class BackgroundTask {
public:
    typedef std::variant<T, archive_error_t> result_t;
    typedef std::function<std::thread(std::packaged_task<result_t()>)> launcher_t;

    explicit BackgroundTask(std::function<result_t()> fn, launcher_t launcher = launch_thread) {
        std::packaged_task<result_t()> task(std::move(fn));
        result = task.get_future();
        try {
            thread = launcher(std::move(task));
        } catch (const std::system_error &e) {
            start_error = std::string("could not start background task: ") + e.what();
        }
    }

    static std::thread launch_thread(std::packaged_task<result_t()> task) {
        return std::thread(std::move(task));
    }

    BackgroundTask(const BackgroundTask &) = delete;
    BackgroundTask &operator=(const BackgroundTask &) = delete;

    ~BackgroundTask() {
        if (thread.joinable()) {
            thread.join();
        }
    }

    // non-blocking
    bool is_ready() const {
        if (start_error.has_value() || !result.valid()) {
            return true;
        }
        return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    // blocks until the operation completes
    result_t join() {
        if (thread.joinable()) {
            thread.join();
        }
        if (start_error.has_value()) {
            return task_error(start_error.value());
        }
        if (!result.valid()) {
            return task_error("task result has already been taken");
        }
        try {
            return result.get();
        } catch (const std::exception &e) {
            return task_error(std::string("background task terminated: ") + e.what());
        } catch (...) {
            return task_error("background task terminated with unknown exception");
        }
    }

private:
    std::future<result_t> result;
    std::thread thread;
    std::optional<std::string> start_error;
};

// polls the task and emits an indeterminate tick per interval until it completes
template<class T>
std::variant<T, archive_error_t> wait_task(BackgroundTask<T> &task, StatusSink *sink) {
    if (sink == nullptr) {
        return task.join();
    }
    while (!task.is_ready()) {
        update_status(sink, update_status_t { std::nullopt, std::nullopt, 1, std::nullopt });
        std::this_thread::sleep_for(std::chrono::milliseconds(TASK_POLL_INTERVAL_MS));
    }
    return task.join();
}
