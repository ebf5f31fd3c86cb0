#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <cstddef>
#include <utility>

// Bounded blocking FIFO between one producer and many consumers.
// Push blocks while the queue is full, Pop blocks while it is empty.
// After Close() consumers drain what is left and then get std::nullopt.
// After Cancel() both sides return immediately and queued items are dropped.
template <typename T>
class TaskQueue
{
public:
    explicit TaskQueue(size_t Capacity): QueueCapacity(Capacity == 0 ? 1 : Capacity)
    {
    }

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false if the queue was closed or cancelled and Item was not queued.
    bool Push(T Item)
    {
        std::unique_lock<std::mutex> Lock(QueueMutex);
        NotFull.wait(Lock, [this]() { return Items.size() < QueueCapacity || Closed || Cancelled; });
        if (Closed || Cancelled)
        {
            return false;
        }
        Items.push(std::move(Item));
        if (Items.size() > PeakSize)
        {
            PeakSize = Items.size();
        }
        Lock.unlock();
        NotEmpty.notify_one();
        return true;
    }

    std::optional<T> Pop()
    {
        std::unique_lock<std::mutex> Lock(QueueMutex);
        NotEmpty.wait(Lock, [this]() { return !Items.empty() || Closed || Cancelled; });
        if (Cancelled || Items.empty())
        {
            return std::nullopt;
        }
        T Item = std::move(Items.front());
        Items.pop();
        Lock.unlock();
        NotFull.notify_one();
        return Item;
    }

    void Close()
    {
        {
            std::lock_guard<std::mutex> Lock(QueueMutex);
            Closed = true;
        }
        NotEmpty.notify_all();
        NotFull.notify_all();
    }

    void Cancel()
    {
        {
            std::lock_guard<std::mutex> Lock(QueueMutex);
            Cancelled = true;
            std::queue<T>().swap(Items);
        }
        NotEmpty.notify_all();
        NotFull.notify_all();
    }

    size_t Capacity() const { return QueueCapacity; }

    size_t Size() const
    {
        std::lock_guard<std::mutex> Lock(QueueMutex);
        return Items.size();
    }

    // Largest number of items ever held at once.
    size_t HighWaterMark() const
    {
        std::lock_guard<std::mutex> Lock(QueueMutex);
        return PeakSize;
    }

private:
    const size_t QueueCapacity;
    std::queue<T> Items;
    size_t PeakSize = 0;
    bool Closed = false;
    bool Cancelled = false;

    mutable std::mutex QueueMutex;
    std::condition_variable NotEmpty;
    std::condition_variable NotFull;
};
