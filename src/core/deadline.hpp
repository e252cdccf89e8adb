#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

/**
 * @brief Thrown when a bounded call does not complete before its deadline
 */
struct DeadlineExceeded : std::runtime_error {
    std::chrono::milliseconds limit;

    DeadlineExceeded(const std::string& what, std::chrono::milliseconds l)
        : std::runtime_error(what + " exceeded deadline of " + std::to_string(l.count()) + " ms")
        , limit(l) {}
};

/**
 * @brief Run a blocking capability call with an upper bound on its duration
 *
 * The call runs on a detached helper thread. If it finishes in time its
 * result (or exception) is returned to the caller as if called directly.
 * If the deadline passes first, DeadlineExceeded is thrown and the late
 * result is discarded when the helper eventually finishes.
 *
 * Anything captured by @p fn must outlive a call that may still be running
 * after the deadline; capture shared state by value or shared_ptr.
 *
 * @param what Name of the operation, used in the error message
 * @param limit Maximum time to wait
 * @param fn Callable to execute
 * @return Whatever @p fn returns
 */
template<class F>
auto call_with_deadline(const std::string& what, std::chrono::milliseconds limit, F fn)
    -> decltype(fn())
{
    using R = decltype(fn());
    auto done = std::make_shared<std::promise<R>>();
    auto result = done->get_future();

    std::thread worker([done, fn = std::move(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                done->set_value();
            } else {
                done->set_value(fn());
            }
        } catch (...) {
            // forwarded to the waiting caller through the future
            done->set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (result.wait_for(limit) != std::future_status::ready) {
        throw DeadlineExceeded(what, limit);
    }
    return result.get();
}
