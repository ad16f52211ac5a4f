#pragma once

/**
 * @file bounded_call.h
 * @brief Run a blocking collaborator call with an upper bound on wait time
 *
 * The call runs on a detached thread that shares ownership of its result
 * slot, so a caller that gives up after the bound leaves nothing dangling.
 * The worker finishes in the background and its late result is discarded.
 */

#include "errors.h"
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace carebridge {

/**
 * @brief Start fn() on a detached worker; the future yields its value or error
 *
 * fn must own everything it touches (capture by value or shared_ptr).
 */
template<typename T, typename Fn>
std::future<Result<T>> launch_detached(Fn fn, const std::string& what) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    std::future<Result<T>> future = promise->get_future();

    std::thread([promise, fn = std::move(fn), what]() mutable {
        try {
            promise->set_value(Result<T>(fn()));
        } catch (const std::exception& e) {
            promise->set_value(Result<T>(make_collaborator_error(what + " failed: " + e.what())));
        } catch (...) {
            promise->set_value(Result<T>(make_collaborator_error(what + " failed: unknown exception")));
        }
    }).detach();

    return future;
}

/**
 * @brief Wait at most timeout_ms for a launched call
 * @return The call's result, or CollaboratorTimeout when the bound elapses
 */
template<typename T>
Result<T> await_bounded(std::future<Result<T>>& future, int timeout_ms, const std::string& what) {
    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        return make_timeout_error(what + " exceeded " + std::to_string(timeout_ms) + "ms");
    }
    return future.get();
}

/**
 * @brief Invoke fn() and wait at most timeout_ms for it
 *
 * @return fn's value, CollaboratorTimeout when the bound elapses, or
 *         CollaboratorError when fn throws.
 */
template<typename T, typename Fn>
Result<T> call_with_timeout(Fn fn, int timeout_ms, const std::string& what) {
    std::future<Result<T>> future = launch_detached<T>(std::move(fn), what);
    return await_bounded(future, timeout_ms, what);
}

} // namespace carebridge
