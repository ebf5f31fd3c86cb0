#include "ProgressReporter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

ProgressReporter::ProgressReporter(const ProgressState& ProgressCounters, Sink Callback, std::chrono::milliseconds SampleInterval)
    : State(ProgressCounters), OnSample(std::move(Callback)), Interval(SampleInterval)
{
}

ProgressReporter::~ProgressReporter()
{
    Stop();
}

void ProgressReporter::Start()
{
    std::lock_guard<std::mutex> Lock(StopMutex);
    if (Started)
    {
        return;
    }
    Started = true;
    ReporterThread = std::thread(&ProgressReporter::ReporterLoop, this);
}

void ProgressReporter::Stop()
{
    {
        std::lock_guard<std::mutex> Lock(StopMutex);
        if (FinalDelivered)
        {
            return;
        }
        StopRequested = true;
    }
    Stop_CV.notify_all();

    if (ReporterThread.joinable())
    {
        ReporterThread.join();
    }

    {
        std::lock_guard<std::mutex> Lock(StopMutex);
        FinalDelivered = true;
    }
    ProgressSample Last = TakeSample(true);
    if (OnSample)
    {
        OnSample(Last);
    }
}

void ProgressReporter::ReporterLoop()
{
    std::unique_lock<std::mutex> Lock(StopMutex);
    while (!Stop_CV.wait_for(Lock, Interval, [this]() { return StopRequested; }))
    {
        Lock.unlock();
        ProgressSample Sample = TakeSample(false);
        if (OnSample)
        {
            OnSample(Sample);
        }
        Lock.lock();
    }
}

ProgressSample ProgressReporter::TakeSample(bool Final)
{
    ProgressSnapshot Snapshot = State.Snapshot();

    double Throughput = 0.0;
    if (Final)
    {
        const double Seconds = std::chrono::duration<double>(Snapshot.Elapsed).count();
        Throughput = Seconds > 0.0 ? static_cast<double>(Snapshot.BytesDone) / Seconds : 0.0;
    }
    else
    {
        const double DeltaSeconds = std::chrono::duration<double>(Snapshot.Elapsed - LastElapsed).count();
        if (DeltaSeconds > 0.0)
        {
            const double Instant = static_cast<double>(Snapshot.BytesDone - LastBytes) / DeltaSeconds;
            SmoothedThroughput = HaveThroughput ? SmoothingFactor * Instant + (1.0 - SmoothingFactor) * SmoothedThroughput : Instant;
            HaveThroughput = true;
        }
        Throughput = SmoothedThroughput;
    }
    LastBytes = Snapshot.BytesDone;
    LastElapsed = Snapshot.Elapsed;

    return Compute(Snapshot, Throughput, Final);
}

ProgressSample ProgressReporter::Compute(const ProgressSnapshot& Snapshot, double Throughput, bool Final)
{
    ProgressSample Sample;
    Sample.Snapshot = Snapshot;
    Sample.Throughput = Throughput;
    Sample.Final = Final;

    // Every discovered file has either been hashed or failed; bytes of failed files never arrive.
    const bool AllResolved = Snapshot.FilesDone + Snapshot.FilesFailed >= Snapshot.FilesTotal;
    if (Final && AllResolved)
    {
        Sample.Percent = 100.0;
    }
    else if (Snapshot.BytesTotal > 0)
    {
        Sample.Percent = std::min(100.0, 100.0 * static_cast<double>(Snapshot.BytesDone) / static_cast<double>(Snapshot.BytesTotal));
    }
    else
    {
        Sample.Percent = 0.0;
    }

    if (Final)
    {
        Sample.Eta = std::chrono::seconds(0);
    }
    else if (Throughput > 0.0 && Snapshot.EnumerationComplete)
    {
        const uint64_t Remaining = Snapshot.BytesTotal > Snapshot.BytesDone ? Snapshot.BytesTotal - Snapshot.BytesDone : 0;
        Sample.Eta = std::chrono::seconds(static_cast<long long>(std::ceil(static_cast<double>(Remaining) / Throughput)));
    }
    return Sample;
}
