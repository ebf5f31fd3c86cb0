#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <cstdint>

#include "HashTypes.hpp"
#include "Hasher.hpp"
#include "FileScanner.hpp"
#include "ProgressReporter.hpp"

constexpr size_t MaxDefaultWorkers = 32;
constexpr size_t MaxWorkers = 1024;
constexpr size_t MinChunkSize = 4 * 1024;
constexpr size_t MaxChunkSize = 64 * 1024 * 1024;

struct HashOptions
{
    std::string Root;
    long long Workers = 0;                       // must be >= 1
    HashAlgorithm Algorithm = HashAlgorithm::Blake2b;
    size_t ChunkSize = 1024 * 1024;
    size_t QueueDepthPerWorker = 4;
    ScanOptions Scan;
    std::chrono::milliseconds ProgressInterval{ 250 };
    ProgressReporter::Sink ProgressSink;         // optional
};

enum class RunStatus
{
    Success,
    RootNotFound,
    ConfigurationError,
    OutputWriteError,
    RootVanished,
    Cancelled,
    InternalError
};

const char* RunStatusToString(RunStatus Status);

enum class RunState
{
    Idle,
    Enumerating,
    Hashing,
    Aggregating,
    Done
};

const char* RunStateToString(RunState State);

struct RunReport
{
    RunStatus Status = RunStatus::Success;
    std::string Message;
    RunResult Results;                           // empty unless Status is Success
    ProgressSnapshot Progress;
    uint64_t Succeeded = 0;
    uint64_t Failed = 0;
    size_t WorkerCount = 0;
    size_t QueueCapacity = 0;
    size_t PeakQueueDepth = 0;
};

// One scanner thread feeds a bounded queue drained by a fixed set of HashWorkers;
// the calling thread reassembles results in enumeration order. Single-shot.
class HashPipeline
{
public:
    explicit HashPipeline(HashOptions Options);

    HashPipeline(const HashPipeline&) = delete;
    HashPipeline& operator=(const HashPipeline&) = delete;

    RunReport Run();

    // Safe to call from any thread while Run() is in progress.
    void Cancel();

    RunState State() const { return CurrentState.load(); }

    static bool ValidateOptions(const HashOptions& Options, std::string& Error);

    // min(hardware concurrency, 32), at least 1.
    static size_t DefaultWorkerCount();

private:
    HashOptions Options;
    std::atomic<RunState> CurrentState{ RunState::Idle };
    std::atomic<bool> StopRequested{ false };
    std::atomic<bool> CancelRequested{ false };

    // Unblocks the queue and the aggregator of the run in progress.
    std::mutex CancelMutex;
    std::function<void()> CancelAction;

    void SetState(RunState State);
};
