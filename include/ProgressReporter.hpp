#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "ProgressState.hpp"

struct ProgressSample
{
    ProgressSnapshot Snapshot;
    double Percent = 0.0;                       // of bytes discovered so far, 0..100
    double Throughput = 0.0;                    // bytes per second
    std::optional<std::chrono::seconds> Eta;    // empty while unknown
    bool Final = false;
};

// Samples a ProgressState on a fixed interval from its own thread and hands each
// sample to a sink. Counters are read atomically; workers are never blocked.
class ProgressReporter
{
public:
    using Sink = std::function<void(const ProgressSample&)>;

    static constexpr double SmoothingFactor = 0.3;

    ProgressReporter(const ProgressState& State, Sink OnSample, std::chrono::milliseconds Interval);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Start();

    // Stops the sampling thread and always delivers one final sample.
    void Stop();

    // Builds a sample from a snapshot and an already computed throughput.
    static ProgressSample Compute(const ProgressSnapshot& Snapshot, double Throughput, bool Final);

private:
    const ProgressState& State;
    Sink OnSample;
    std::chrono::milliseconds Interval;

    std::thread ReporterThread;
    std::mutex StopMutex;
    std::condition_variable Stop_CV;
    bool StopRequested = false;
    bool Started = false;
    bool FinalDelivered = false;

    uint64_t LastBytes = 0;
    std::chrono::steady_clock::duration LastElapsed{};
    double SmoothedThroughput = 0.0;
    bool HaveThroughput = false;

    void ReporterLoop();
    ProgressSample TakeSample(bool Final);
};
