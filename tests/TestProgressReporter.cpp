#include "HashWorker.hpp"
#include "ProgressReporter.hpp"
#include "TestUtils.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Percent, throughput and ETA are derived from the snapshot", "[progress]")
{
    ProgressSnapshot Snap;
    Snap.BytesDone = 250;
    Snap.BytesTotal = 1000;
    Snap.EnumerationComplete = true;

    SECTION("running sample")
    {
        ProgressSample Sample = ProgressReporter::Compute(Snap, 50.0, false);
        REQUIRE(Sample.Percent == Approx(25.0));
        REQUIRE(Sample.Eta);
        REQUIRE(Sample.Eta->count() == 15);
        REQUIRE_FALSE(Sample.Final);
    }

    SECTION("no throughput yet means no ETA")
    {
        REQUIRE_FALSE(ProgressReporter::Compute(Snap, 0.0, false).Eta);
    }

    SECTION("ETA unknown while enumeration is still running")
    {
        Snap.EnumerationComplete = false;
        REQUIRE_FALSE(ProgressReporter::Compute(Snap, 50.0, false).Eta);
    }

    SECTION("zero total bytes")
    {
        Snap.BytesDone = 0;
        Snap.BytesTotal = 0;
        REQUIRE(ProgressReporter::Compute(Snap, 0.0, false).Percent == 0.0);
        REQUIRE(ProgressReporter::Compute(Snap, 0.0, true).Percent == 100.0);
    }

    SECTION("final sample of a cancelled run keeps the real percent")
    {
        Snap.FilesTotal = 4;
        Snap.FilesDone = 1;
        REQUIRE(ProgressReporter::Compute(Snap, 10.0, true).Percent == Approx(25.0));
    }

    SECTION("percent is capped when files grew while hashing")
    {
        Snap.BytesDone = 1500;
        REQUIRE(ProgressReporter::Compute(Snap, 10.0, false).Percent == 100.0);
    }
}

TEST_CASE("Reporter samples periodically and always delivers a final sample", "[progress]")
{
    ProgressState State;
    State.AddDiscovered(1000);
    State.MarkEnumerationComplete();

    std::mutex SamplesMutex;
    std::vector<ProgressSample> Samples;

    ProgressReporter Reporter(State, [&](const ProgressSample& Sample)
    {
        std::lock_guard<std::mutex> Lock(SamplesMutex);
        Samples.push_back(Sample);
    }, 20ms);

    Reporter.Start();
    for (int i = 0; i < 10; ++i)
    {
        State.AddBytesDone(100);
        std::this_thread::sleep_for(10ms);
    }
    State.AddFileDone();
    Reporter.Stop();
    Reporter.Stop();

    std::lock_guard<std::mutex> Lock(SamplesMutex);
    REQUIRE(Samples.size() >= 2);
    REQUIRE(Samples.back().Final);
    REQUIRE(Samples.back().Percent == Approx(100.0));
    REQUIRE(Samples.back().Snapshot.FilesDone == 1);

    size_t FinalCount = 0;
    uint64_t LastBytes = 0;
    for (const auto& Sample : Samples)
    {
        FinalCount += Sample.Final ? 1 : 0;
        REQUIRE(Sample.Snapshot.BytesDone >= LastBytes);
        LastBytes = Sample.Snapshot.BytesDone;
    }
    REQUIRE(FinalCount == 1);
}

TEST_CASE("Final sample reaches 100 percent when a file could not be read", "[progress][errors]")
{
    TestUtils::TempDir Dir;
    TestUtils::WriteFile(Dir.Root() / "gone.bin", TestUtils::Pattern(1000, 3));
    TestUtils::WriteFile(Dir.Root() / "kept.txt", "hello");

    ProgressState State;
    State.AddDiscovered(1000);
    State.AddDiscovered(5);
    State.MarkEnumerationComplete();
    std::filesystem::remove(Dir.Root() / "gone.bin");

    std::vector<ProgressSample> Samples;
    std::mutex SamplesMutex;
    ProgressReporter Reporter(State, [&](const ProgressSample& Sample)
    {
        std::lock_guard<std::mutex> Lock(SamplesMutex);
        Samples.push_back(Sample);
    }, 20ms);
    Reporter.Start();

    HashWorker Worker(HashAlgorithm::Blake2b, DefaultChunkSize, State);
    for (const char* Name : { "gone.bin", "kept.txt" })
    {
        FileTask Task;
        Task.RelativePath = Name;
        Task.AbsolutePath = (Dir.Root() / Name).string();
        Task.SizeBytes = std::string(Name) == "gone.bin" ? 1000 : 5;
        Worker.HashFile(Task);
    }
    Reporter.Stop();

    std::lock_guard<std::mutex> Lock(SamplesMutex);
    REQUIRE_FALSE(Samples.empty());
    const ProgressSample& Last = Samples.back();
    REQUIRE(Last.Final);
    REQUIRE(Last.Snapshot.FilesFailed == 1);
    REQUIRE(Last.Snapshot.FilesDone == 1);
    REQUIRE(Last.Snapshot.BytesDone == 5);
    REQUIRE(Last.Percent == Approx(100.0));
}

TEST_CASE("Stop without Start still reports the final state", "[progress]")
{
    ProgressState State;
    int Calls = 0;
    bool SawFinal = false;
    {
        ProgressReporter Reporter(State, [&](const ProgressSample& Sample)
        {
            ++Calls;
            SawFinal = Sample.Final;
        }, 1000ms);
    }
    REQUIRE(Calls == 1);
    REQUIRE(SawFinal);
}

TEST_CASE("Counters are safe under concurrent increments", "[progress][concurrency]")
{
    ProgressState State;
    std::vector<std::thread> Threads;
    for (int t = 0; t < 8; ++t)
    {
        Threads.emplace_back([&State]()
        {
            for (int i = 0; i < 10000; ++i)
            {
                State.AddBytesDone(3);
                State.AddFileDone();
            }
        });
    }
    for (auto& Thread : Threads)
    {
        Thread.join();
    }
    ProgressSnapshot Snap = State.Snapshot();
    REQUIRE(Snap.BytesDone == 8u * 10000u * 3u);
    REQUIRE(Snap.FilesDone == 8u * 10000u);
}
