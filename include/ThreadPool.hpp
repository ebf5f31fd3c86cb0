#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

class ThreadPool
{
public:
    ThreadPool() = default;
    explicit ThreadPool(size_t ThreadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Submit(std::function<void()> Job);

    // Blocks until every submitted job has finished.
    void Join();

    size_t Size() const { return Workers.size(); }

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;

    std::mutex ThreadPoolMutex;
    std::condition_variable ThreadPool_CV;
    std::condition_variable ThreadPoolIdle_CV;
    bool ThreadPoolStop = false;
    size_t ThreadPoolActiveJobs = 0;

    void WorkerThread();
};
