#include "ResultAggregator.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace
{
    HashResult MakeResult(uint64_t Index)
    {
        HashResult Result;
        Result.Index = Index;
        Result.Outcome = HashSuccess{ "file" + std::to_string(Index), { static_cast<uint8_t>(Index) }, Index };
        return Result;
    }
}

TEST_CASE("Aggregator releases results in enumeration order", "[aggregator][ordering]")
{
    ResultAggregator Aggregator;
    Aggregator.Submit(MakeResult(2));
    Aggregator.Submit(MakeResult(0));
    Aggregator.Submit(MakeResult(3));
    Aggregator.Submit(MakeResult(1));
    Aggregator.SetExpectedCount(4);

    std::vector<uint64_t> Order;
    while (auto Result = Aggregator.Next())
    {
        Order.push_back(Result->Index);
    }
    REQUIRE(Order == std::vector<uint64_t>{ 0, 1, 2, 3 });

    std::string Error;
    REQUIRE(Aggregator.Verify(4, Error));
    REQUIRE(Aggregator.Buffered() == 0);
}

TEST_CASE("Aggregator buffers early arrivals until the gap is filled", "[aggregator]")
{
    ResultAggregator Aggregator;
    Aggregator.Submit(MakeResult(1));
    Aggregator.Submit(MakeResult(2));
    REQUIRE(Aggregator.Buffered() == 2);
    REQUIRE(Aggregator.Released() == 0);

    std::thread Late([&Aggregator]()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Aggregator.Submit(MakeResult(0));
        Aggregator.SetExpectedCount(3);
    });

    auto First = Aggregator.Next();
    REQUIRE(First);
    REQUIRE(First->Index == 0);
    REQUIRE(Aggregator.Next()->Index == 1);
    REQUIRE(Aggregator.Next()->Index == 2);
    REQUIRE_FALSE(Aggregator.Next());
    Late.join();
    REQUIRE(Aggregator.PeakBuffered() >= 2);
}

TEST_CASE("Aggregator with many concurrent submitters keeps order", "[aggregator][ordering]")
{
    const uint64_t Count = 2000;
    std::vector<uint64_t> Indices(Count);
    for (uint64_t i = 0; i < Count; ++i)
    {
        Indices[i] = i;
    }
    std::shuffle(Indices.begin(), Indices.end(), std::mt19937(42));

    ResultAggregator Aggregator;
    std::vector<std::thread> Threads;
    for (size_t t = 0; t < 4; ++t)
    {
        Threads.emplace_back([&, t]()
        {
            for (size_t i = t; i < Indices.size(); i += 4)
            {
                Aggregator.Submit(MakeResult(Indices[i]));
            }
        });
    }
    Aggregator.SetExpectedCount(Count);

    uint64_t Expected = 0;
    while (auto Result = Aggregator.Next())
    {
        REQUIRE(Result->Index == Expected);
        ++Expected;
    }
    for (auto& Thread : Threads)
    {
        Thread.join();
    }
    REQUIRE(Expected == Count);
}

TEST_CASE("Aggregator cross-check detects duplicates and shortfalls", "[aggregator][errors]")
{
    std::string Error;

    SECTION("duplicate index")
    {
        ResultAggregator Aggregator;
        Aggregator.Submit(MakeResult(0));
        Aggregator.Submit(MakeResult(0));
        Aggregator.SetExpectedCount(1);
        while (Aggregator.Next())
        {
        }
        REQUIRE_FALSE(Aggregator.Verify(1, Error));
        REQUIRE(Error.find("duplicate") != std::string::npos);
    }

    SECTION("count mismatch")
    {
        ResultAggregator Aggregator;
        Aggregator.Submit(MakeResult(0));
        Aggregator.SetExpectedCount(1);
        while (Aggregator.Next())
        {
        }
        REQUIRE_FALSE(Aggregator.Verify(2, Error));
    }
}

TEST_CASE("Abort unblocks a waiting consumer", "[aggregator][cancel]")
{
    ResultAggregator Aggregator;
    std::thread Aborter([&Aggregator]()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        Aggregator.Abort();
    });
    REQUIRE_FALSE(Aggregator.Next());
    Aborter.join();
}

TEST_CASE("Zero expected results completes immediately", "[aggregator]")
{
    ResultAggregator Aggregator;
    Aggregator.SetExpectedCount(0);
    REQUIRE_FALSE(Aggregator.Next());
    std::string Error;
    REQUIRE(Aggregator.Verify(0, Error));
}
