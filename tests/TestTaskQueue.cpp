#include "TaskQueue.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST_CASE("TaskQueue is FIFO and drains after Close", "[queue]")
{
    TaskQueue<int> Queue(4);
    REQUIRE(Queue.Push(1));
    REQUIRE(Queue.Push(2));
    REQUIRE(Queue.Push(3));
    Queue.Close();

    REQUIRE_FALSE(Queue.Push(4));
    REQUIRE(Queue.Pop() == 1);
    REQUIRE(Queue.Pop() == 2);
    REQUIRE(Queue.Pop() == 3);
    REQUIRE_FALSE(Queue.Pop().has_value());
}

TEST_CASE("TaskQueue blocks the producer when full", "[queue][backpressure]")
{
    TaskQueue<int> Queue(2);
    std::atomic<int> Pushed{ 0 };

    std::thread Producer([&]()
    {
        for (int i = 0; i < 10; ++i)
        {
            Queue.Push(i);
            ++Pushed;
        }
        Queue.Close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(Pushed.load() == 2);
    REQUIRE(Queue.Size() == 2);

    std::vector<int> Received;
    while (auto Item = Queue.Pop())
    {
        Received.push_back(*Item);
    }
    Producer.join();

    REQUIRE(Received.size() == 10);
    for (int i = 0; i < 10; ++i)
    {
        REQUIRE(Received[i] == i);
    }
    REQUIRE(Queue.HighWaterMark() <= Queue.Capacity());
}

TEST_CASE("TaskQueue Cancel releases blocked producers and consumers", "[queue][cancel]")
{
    SECTION("blocked consumer")
    {
        TaskQueue<int> Queue(1);
        std::atomic<bool> GotItem{ true };
        std::thread Consumer([&]() { GotItem = Queue.Pop().has_value(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Queue.Cancel();
        Consumer.join();
        REQUIRE_FALSE(GotItem.load());
    }

    SECTION("blocked producer and queued items are dropped")
    {
        TaskQueue<int> Queue(1);
        REQUIRE(Queue.Push(1));
        std::atomic<bool> Result{ true };
        std::thread Producer([&]() { Result = Queue.Push(2); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Queue.Cancel();
        Producer.join();
        REQUIRE_FALSE(Result.load());
        REQUIRE_FALSE(Queue.Pop().has_value());
    }
}

TEST_CASE("TaskQueue capacity is at least one", "[queue]")
{
    TaskQueue<int> Queue(0);
    REQUIRE(Queue.Capacity() == 1);
}
