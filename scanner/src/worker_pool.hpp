#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed number of threads draining a work list. run() hands every item to
// func and returns once all of them were processed.
template <typename T>
class worker_pool {
    static_assert(std::is_move_constructible<T>::value && std::is_move_assignable<T>::value,
                  "worker_pool items must be movable");

    using Func = std::function<void(T&&)>;

    const std::size_t n_threads;
    const Func func;

    std::vector<T> vals;
    std::mutex mtx;
    bool running = false;

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lk{mtx};
        if (vals.empty())
            return std::nullopt;
        auto t = std::move(vals.back());
        vals.pop_back();
        return t;
    }

    void worker_loop() {
        while (auto t_opt = pop())
            func(std::move(*t_opt));
    }

 public:
    worker_pool(std::size_t n_threads, Func func)
        : n_threads{std::max<std::size_t>(1, n_threads)}, func{std::move(func)} {}

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    // func must not throw; callers isolate failures per item
    void run(std::vector<T> items) {
        std::size_t count;
        {
            std::lock_guard<std::mutex> lk{mtx};
            if (running)
                throw std::runtime_error("worker_pool::run called while busy");
            running = true;
            count = std::min(n_threads, items.size());
            vals = std::move(items);
        }

        std::vector<std::thread> threads;
        threads.reserve(count);
        for (std::size_t i = 0; i < count; i++)
            threads.emplace_back(&worker_pool::worker_loop, this);
        for (auto& t : threads)
            t.join();

        std::lock_guard<std::mutex> lk{mtx};
        running = false;
    }
};
