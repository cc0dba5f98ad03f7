#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace chunkvault::parallel {

// `requested` == 0 means one worker per hardware thread.
inline std::size_t ResolveWorkers(std::size_t requested, std::size_t max_tasks) {
    std::size_t workers = requested;
    if (workers == 0) {
        unsigned int hw = std::thread::hardware_concurrency();
        workers = hw > 0 ? static_cast<std::size_t>(hw) : 1;
    }
    return std::min(workers, std::max<std::size_t>(1, max_tasks));
}

// Runs fn(0..count-1) on up to `workers` threads. After the first exception no
// new indices are started; that exception is rethrown once all threads joined.
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t workers, Fn&& fn) {
    workers = ResolveWorkers(workers, count);
    if (count == 0 || workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            while (!failed.load()) {
                std::size_t idx = next.fetch_add(1);
                if (idx >= count) {
                    break;
                }
                try {
                    fn(idx);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed.store(true);
                }
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace chunkvault::parallel
