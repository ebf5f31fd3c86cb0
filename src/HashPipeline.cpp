#include "HashPipeline.hpp"
#include "HashWorker.hpp"
#include "ResultAggregator.hpp"
#include "TaskQueue.hpp"
#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

const char* RunStatusToString(RunStatus Status)
{
    switch (Status)
    {
    case RunStatus::Success:            return "Success";
    case RunStatus::RootNotFound:       return "RootNotFoundError";
    case RunStatus::ConfigurationError: return "ConfigurationError";
    case RunStatus::OutputWriteError:   return "OutputWriteError";
    case RunStatus::RootVanished:       return "RootVanishedError";
    case RunStatus::Cancelled:          return "Cancelled";
    case RunStatus::InternalError:      return "InternalError";
    default:                            return "Unknown";
    }
}

const char* RunStateToString(RunState State)
{
    switch (State)
    {
    case RunState::Idle:        return "Idle";
    case RunState::Enumerating: return "Enumerating";
    case RunState::Hashing:     return "Hashing";
    case RunState::Aggregating: return "Aggregating";
    case RunState::Done:        return "Done";
    default:                    return "Unknown";
    }
}

HashPipeline::HashPipeline(HashOptions RunOptions): Options(std::move(RunOptions))
{
}

size_t HashPipeline::DefaultWorkerCount()
{
    const size_t Hardware = std::thread::hardware_concurrency();
    return std::max<size_t>(1, std::min(Hardware, MaxDefaultWorkers));
}

bool HashPipeline::ValidateOptions(const HashOptions& RunOptions, std::string& Error)
{
    if (RunOptions.Root.empty())
    {
        Error = "no root directory given";
        return false;
    }
    if (RunOptions.Workers < 1)
    {
        Error = "worker count must be at least 1 (got " + std::to_string(RunOptions.Workers) + ")";
        return false;
    }
    if (static_cast<unsigned long long>(RunOptions.Workers) > MaxWorkers)
    {
        Error = "worker count must not exceed " + std::to_string(MaxWorkers) + " (got " + std::to_string(RunOptions.Workers) + ")";
        return false;
    }
    if (RunOptions.ChunkSize < MinChunkSize || RunOptions.ChunkSize > MaxChunkSize)
    {
        Error = "chunk size must be between " + std::to_string(MinChunkSize) + " and " + std::to_string(MaxChunkSize) + " bytes";
        return false;
    }
    if (RunOptions.QueueDepthPerWorker < 1)
    {
        Error = "queue depth per worker must be at least 1";
        return false;
    }
    if (RunOptions.ProgressInterval < std::chrono::milliseconds(20))
    {
        Error = "progress interval must be at least 20 ms";
        return false;
    }
    return true;
}

void HashPipeline::SetState(RunState State)
{
    Log.Debug(std::string("[HashPipeline] ") + RunStateToString(CurrentState.load()) + " -> " + RunStateToString(State));
    CurrentState.store(State);
}

void HashPipeline::Cancel()
{
    CancelRequested = true;
    StopRequested = true;

    std::lock_guard<std::mutex> Lock(CancelMutex);
    if (CancelAction)
    {
        CancelAction();
    }
}

RunReport HashPipeline::Run()
{
    RunReport Report;

    RunState Expected = RunState::Idle;
    if (!CurrentState.compare_exchange_strong(Expected, RunState::Enumerating))
    {
        Report.Status = RunStatus::ConfigurationError;
        Report.Message = "pipeline has already run";
        return Report;
    }

    std::string Error;
    if (!ValidateOptions(Options, Error))
    {
        Log.Error("Configuration error: " + Error);
        Report.Status = RunStatus::ConfigurationError;
        Report.Message = Error;
        SetState(RunState::Done);
        return Report;
    }
    if (!FileScanner::CheckRoot(Options.Root, Error))
    {
        Log.Error("Error: " + Error);
        Report.Status = RunStatus::RootNotFound;
        Report.Message = Error;
        SetState(RunState::Done);
        return Report;
    }

    const size_t WorkerCount = static_cast<size_t>(Options.Workers);
    Report.WorkerCount = WorkerCount;

    ProgressState Progress;
    TaskQueue<FileTask> Tasks(WorkerCount * Options.QueueDepthPerWorker);
    ResultAggregator Aggregator;
    Report.QueueCapacity = Tasks.Capacity();

    std::vector<std::unique_ptr<HashWorker>> Workers;
    try
    {
        for (size_t i = 0; i < WorkerCount; ++i)
        {
            Workers.push_back(std::make_unique<HashWorker>(Options.Algorithm, Options.ChunkSize, Progress));
        }
    }
    catch (const std::exception& e)
    {
        Log.Error(std::string("Cannot initialise hasher: ") + e.what());
        Report.Status = RunStatus::ConfigurationError;
        Report.Message = std::string("cannot initialise hasher: ") + e.what();
        SetState(RunState::Done);
        return Report;
    }

    {
        std::lock_guard<std::mutex> Lock(CancelMutex);
        CancelAction = [&Tasks, &Aggregator]()
        {
            Tasks.Cancel();
            Aggregator.Abort();
        };
        if (CancelRequested)
        {
            CancelAction();
        }
    }

    Log.Info("Using " + std::to_string(WorkerCount) + " worker threads (" + HashAlgorithmName(Options.Algorithm) + ")");
    Log.Info("Scanning directory: " + Options.Root);

    std::unique_ptr<ProgressReporter> Reporter;
    if (Options.ProgressSink)
    {
        Reporter = std::make_unique<ProgressReporter>(Progress, Options.ProgressSink, Options.ProgressInterval);
        Reporter->Start();
    }

    ThreadPool Pool(WorkerCount);
    for (auto& Worker : Workers)
    {
        HashWorker* Current = Worker.get();
        Pool.Submit([this, Current, &Tasks, &Aggregator]()
        {
            Current->Run(Tasks, [&Aggregator](HashResult&& Result) { Aggregator.Submit(std::move(Result)); }, StopRequested);
        });
    }

    FileScanner Scanner(Options.Scan);
    ScanStatus ScanResult = ScanStatus::Completed;
    std::string ScanError;

    std::thread Producer([&]()
    {
        try
        {
            ScanResult = Scanner.Scan(Options.Root, [&](ScanEntry&& Entry)
            {
                if (StopRequested.load())
                {
                    return false;
                }
                RunState Enumerating = RunState::Enumerating;
                if (CurrentState.compare_exchange_strong(Enumerating, RunState::Hashing))
                {
                    Log.Debug("[HashPipeline] Enumerating -> Hashing");
                }
                if (Entry.Failure)
                {
                    Progress.AddFileFailed();
                    HashResult Result;
                    Result.Index = Entry.Task.Index;
                    Result.Outcome = std::move(*Entry.Failure);
                    Aggregator.Submit(std::move(Result));
                    return true;
                }
                return Tasks.Push(std::move(Entry.Task));
            }, &Progress);
        }
        catch (const std::exception& e)
        {
            ScanError = e.what();
            ScanResult = ScanStatus::Stopped;
        }

        Tasks.Close();
        if (ScanResult == ScanStatus::Completed)
        {
            Log.Debug("[HashPipeline] Enumeration complete: " + std::to_string(Scanner.EntryCount()) + " entries");
            Aggregator.SetExpectedCount(Scanner.EntryCount());
        }
        else
        {
            StopRequested = true;
            std::lock_guard<std::mutex> Lock(CancelMutex);
            if (CancelAction)
            {
                CancelAction();
            }
        }
    });

    RunResult Results;
    while (std::optional<HashResult> Next = Aggregator.Next())
    {
        Results.push_back(std::move(*Next));
    }

    Producer.join();
    Pool.Join();
    SetState(RunState::Aggregating);

    {
        std::lock_guard<std::mutex> Lock(CancelMutex);
        CancelAction = nullptr;
    }
    if (Reporter)
    {
        Reporter->Stop();
    }

    Report.Progress = Progress.Snapshot();
    Report.PeakQueueDepth = Tasks.HighWaterMark();

    if (CancelRequested)
    {
        Log.Warn("Run cancelled; " + std::to_string(Results.size()) + " completed results discarded");
        Report.Status = RunStatus::Cancelled;
        Report.Message = "run cancelled";
    }
    else if (ScanResult == ScanStatus::RootVanished)
    {
        Report.Status = RunStatus::RootVanished;
        Report.Message = Options.Root + " vanished during the run";
    }
    else if (ScanResult != ScanStatus::Completed)
    {
        Report.Status = RunStatus::InternalError;
        Report.Message = "enumeration stopped: " + (ScanError.empty() ? std::string(ScanStatusToString(ScanResult)) : ScanError);
    }
    else if (!Aggregator.Verify(Scanner.EntryCount(), Error) || Results.size() != Scanner.EntryCount())
    {
        Report.Status = RunStatus::InternalError;
        Report.Message = "result count mismatch: " + Error;
    }
    else
    {
        for (const HashResult& Result : Results)
        {
            if (Result.IsSuccess())
            {
                ++Report.Succeeded;
            }
            else
            {
                ++Report.Failed;
            }
        }
        Report.Results = std::move(Results);
        Report.Status = RunStatus::Success;
    }

    if (Report.Status != RunStatus::Success && Report.Status != RunStatus::Cancelled)
    {
        Log.Error(std::string(RunStatusToString(Report.Status)) + ": " + Report.Message);
    }

    SetState(RunState::Done);
    return Report;
}
