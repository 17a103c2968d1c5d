#pragma once

#include <chrono>
#include <thread>

namespace mdcache {
namespace testutil {

// Polls pred until it holds or the timeout expires
template<typename Predicate>
bool WaitForCondition(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto start = std::chrono::steady_clock::now();
    while (!pred()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace testutil
} // namespace mdcache
