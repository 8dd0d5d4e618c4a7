#pragma once
#include "detail/config.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <limits>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kpmdos { namespace detail {

/**
 Blocking multi-producer, multi-consumer queue

 `pop()` waits until an item is available or until all producers are gone,
 in which case it returns an empty `Maybe`.
 */
template<class T>
class Queue {
public:
    struct Maybe {
        Maybe() = default;
        Maybe(T&& value) : value(std::move(value)), is_valid(true) {}

        explicit operator bool() const { return is_valid; }
        T get() { return std::move(value); }

    private:
        T value;
        bool is_valid = false;
    };

public:
    Queue() = default;
    explicit Queue(std::size_t max_size) : max_size(max_size) {}
    Queue(Queue const&) = delete;
    Queue& operator=(Queue const&) = delete;

    void add_producer() {
        std::unique_lock<std::mutex> lk(m);
        ++num_producers;
        is_closed = false;
    }

    void remove_producer() {
        std::unique_lock<std::mutex> lk(m);
        --num_producers;
        if (num_producers <= 0)
            is_closed = true;
        lk.unlock();
        consumption_cv.notify_all();
    }

    Maybe pop() {
        std::unique_lock<std::mutex> lk(m);
        consumption_cv.wait(lk, [&] { return !q.empty() || is_closed; });

        if (q.empty())
            return {};

        auto val = std::move(q.front());
        q.pop();
        lk.unlock();
        production_cv.notify_one();
        return Maybe(std::move(val));
    }

    void push(T&& item) {
        std::unique_lock<std::mutex> lk(m);
        production_cv.wait(lk, [&] { return q.size() < max_size; });
        q.push(std::move(item));
        lk.unlock();
        consumption_cv.notify_one();
    }

private:
    std::queue<T> q;
    std::mutex m;
    std::condition_variable production_cv;
    std::condition_variable consumption_cv;

    bool is_closed = false;
    int num_producers = 0;
    std::size_t max_size = std::numeric_limits<std::size_t>::max();
};

} // namespace detail

/**
 Fixed number of worker threads consuming a queue of jobs

 The first exception thrown by a job is captured and all jobs which have not started
 yet are skipped. The exception is rethrown on the calling thread by `join()`.
 */
class ThreadPool {
public:
    explicit ThreadPool(idx_t num_threads) : workers(static_cast<std::size_t>(num_threads)) {
        queue.add_producer();
        for (auto& thread : workers) {
            thread = std::thread([this] {
                while (auto maybe_job = queue.pop()) {
                    auto job = maybe_job.get();
                    if (has_failed) { continue; }

                    try {
                        job();
                    } catch (...) {
                        std::lock_guard<std::mutex> lk(error_mutex);
                        if (!error) { error = std::current_exception(); }
                        has_failed = true;
                    }
                }
            });
        }
    }

    ThreadPool(ThreadPool const&) = delete;
    ThreadPool& operator=(ThreadPool const&) = delete;

    /// The destructor only waits for the workers: an uncollected error is dropped
    ~ThreadPool() { wait(); }

    template<class F>
    void add(F&& f) {
        queue.push(std::function<void()>(std::forward<F>(f)));
    }

    /// Wait for all jobs to finish and rethrow the first exception raised by a job
    void join() {
        wait();
        if (error) {
            auto e = error;
            error = nullptr;
            std::rethrow_exception(e);
        }
    }

private:
    void wait() {
        if (is_joined) { return; }

        queue.remove_producer();
        for (auto& thread : workers) {
            thread.join();
        }
        is_joined = true;
    }

private:
    std::vector<std::thread> workers;
    detail::Queue<std::function<void()>> queue;
    bool is_joined = false;

    std::atomic<bool> has_failed{false};
    std::mutex error_mutex;
    std::exception_ptr error;
};

} // namespace kpmdos
