#pragma once

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        workers.reserve(n_threads);
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int size() const { return static_cast<int>(workers.size()); }

    void submit(std::function<void()> f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
    }

private:
    void worker_loop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            task();
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (--pending == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::deque<std::function<void()>> tasks;
    std::mutex                        mtx;
    std::condition_variable           cv_task;
    std::condition_variable           cv_done;
    int                               pending  = 0;
    bool                              stopping = false;
};

// Submits fn(first_row, end_row) for consecutive disjoint ranges of at most
// `chunk` rows covering [0, rows), then waits for all of them.
inline void for_each_row_range(ThreadPool& pool, int rows, int chunk,
                               const std::function<void(int, int)>& fn)
{
    if (chunk < 1) chunk = 1;
    for (int r0 = 0; r0 < rows; r0 += chunk) {
        const int r1 = std::min(rows, r0 + chunk);
        pool.submit([&fn, r0, r1] { fn(r0, r1); });
    }
    pool.wait();
}
