#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "FormatUtils.hpp"
#include "Logger.hpp"
#include "ManifestWriter.hpp"

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace
{
    std::atomic<bool> InterruptRequested{ false };

    std::mutex ProgressLineMutex;
    bool ProgressLineVisible = false;

    bool StderrIsTerminal()
    {
#ifdef _WIN32
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(STDERR_FILENO) != 0;
#endif
    }

    // Wipes the live status line before a log line is printed over it.
    void ClearProgressLine()
    {
        std::lock_guard<std::mutex> Lock(ProgressLineMutex);
        if (ProgressLineVisible)
        {
            std::cerr << "\r" << std::string(100, ' ') << "\r";
            ProgressLineVisible = false;
        }
    }

    void RenderProgress(const ProgressSample& Sample)
    {
        const ProgressSnapshot& Snap = Sample.Snapshot;
        char Percent[16];
        std::snprintf(Percent, sizeof(Percent), "%5.1f%%", Sample.Percent);

        std::string Line = "Hashing files: ";
        Line += Percent;
        Line += " | " + FormatSize(Snap.BytesDone) + " / " + FormatSize(Snap.BytesTotal);
        if (!Snap.EnumerationComplete)
        {
            Line += "+";
        }
        Line += " | " + std::to_string(Snap.FilesDone + Snap.FilesFailed) + "/" + std::to_string(Snap.FilesTotal) + " files";
        Line += " | " + FormatSize(Sample.Throughput) + "/s";
        if (Sample.Eta && !Sample.Final)
        {
            Line += " | ETA " + FormatDuration(*Sample.Eta);
        }
        else if (Sample.Final)
        {
            Line += " | " + FormatDuration(std::chrono::duration_cast<std::chrono::seconds>(Snap.Elapsed));
        }

        std::lock_guard<std::mutex> Lock(ProgressLineMutex);
        std::cerr << "\r" << Line;
        if (Line.size() < 100)
        {
            std::cerr << std::string(100 - Line.size(), ' ') << "\r" << Line;
        }
        if (Sample.Final)
        {
            std::cerr << "\n";
            ProgressLineVisible = false;
        }
        else
        {
            ProgressLineVisible = true;
        }
        std::cerr.flush();
    }
}

ControlFlow::ControlFlow()
{
    Args.AddOption({ "output", 'o', "Output", true, "", "FILE", "Output CSV file (default: dir_hashes_blake2.csv). Use \"-\" for stdout" });
    Args.AddOption({ "workers", 'w', "Workers", true, "", "N", "Number of worker threads (default: min(CPU cores, 32); 1 for HDD)" });
    Args.AddOption({ "algorithm", 'a', "Algorithm", true, "", "NAME", "Hash algorithm: blake2b (default) or blake3" });
    Args.AddOption({ "config", 'c', "Config", true, "", "FILE", "Read settings from a Key = Value config file" });
    Args.AddOption({ "chunk-size", '\0', "ChunkSize", true, "", "BYTES", "Read buffer size per worker (default: 1048576)" });
    Args.AddOption({ "disk-type", '\0', "DiskType", true, "", "SSD|HDD", "Storage type used to pick the default worker count" });
    Args.AddOption({ "exclude", 'x', "Exclude", true, "", "PATH", "Skip a file or directory, relative to the root (repeatable)" });
    Args.AddOption({ "failures", '\0', "FailureReport", true, "", "FILE", "Write files that could not be hashed to a CSV file" });
    Args.AddOption({ "log-dir", '\0', "LogDir", true, "", "DIR", "Also write a log file into DIR" });
    Args.AddOption({ "no-follow-symlinks", '\0', "FollowSymlinks", false, "false", "", "Skip symbolic links instead of hashing their target files" });
    Args.AddOption({ "no-progress", '\0', "ShowProgress", false, "false", "", "Disable the live progress line" });
    Args.AddOption({ "verbose", 'v', "Verbose", false, "true", "", "Enable verbose logging" });
    Args.AddOption({ "help", 'h', "Help", false, "true", "", "Show this help and exit" });
}

void ControlFlow::RequestInterrupt()
{
    InterruptRequested.store(true);
}

bool ControlFlow::Configure(int argc, const char* const argv[], int& Code)
{
    const std::string Program = argc > 0 ? argv[0] : "treehash";

    Parser.Reset();
    if (!Args.Parse(argc, argv))
    {
        for (const auto& Error : Args.GetErrors())
        {
            std::cerr << Error << "\n";
        }
        std::cerr << Args.Usage(Program);
        Code = ExitUsage;
        return false;
    }
    if (Args.HasSetting("Help"))
    {
        std::cout << "Compute BLAKE2 hashes of all files in a directory recursively.\n\n" << Args.Usage(Program);
        Code = ExitSuccess;
        return false;
    }
    if (Args.GetPositionals().size() != 1)
    {
        std::cerr << (Args.GetPositionals().empty() ? "Missing directory argument\n" : "Too many positional arguments\n");
        std::cerr << Args.Usage(Program);
        Code = ExitUsage;
        return false;
    }
    ConfigGlobal::RootDirectory = Args.GetPositionals().front();

    if (Args.HasSetting("Config"))
    {
        ConfigGlobal::ConfigFile = Args.GetSetting("Config");
        Parser.Parse(ConfigGlobal::ConfigFile);
    }
    for (const auto& [Key, Value] : Args.GetSettings())
    {
        if (Key != "Config" && Key != "Help")
        {
            Parser.ApplySetting(Key, Value, "--" + Key);
        }
    }

    if (!Parser.GetErrors().empty())
    {
        for (const auto& Error : Parser.GetErrors())
        {
            Log.Error("ConfigurationError: " + Error);
        }
        Code = ExitFatal;
        return false;
    }
    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }
    return true;
}

HashOptions ControlFlow::BuildOptions() const
{
    HashOptions Options;
    Options.Root = ConfigGlobal::RootDirectory;
    if (ConfigGlobal::WorkerCount != 0)
    {
        Options.Workers = ConfigGlobal::WorkerCount;
    }
    else
    {
        Options.Workers = ConfigGlobal::DiskType == "HDD" ? 1 : static_cast<long long>(HashPipeline::DefaultWorkerCount());
    }
    if (!ParseHashAlgorithm(ConfigGlobal::Algorithm, Options.Algorithm))
    {
        Log.Warn("Unknown algorithm '" + ConfigGlobal::Algorithm + "', using blake2b");
        Options.Algorithm = HashAlgorithm::Blake2b;
    }
    Options.ChunkSize = static_cast<size_t>(ConfigGlobal::ChunkSize);
    Options.QueueDepthPerWorker = ConfigGlobal::QueueDepthPerWorker;
    Options.Scan.FollowSymlinks = ConfigGlobal::FollowSymlinks;
    Options.Scan.Excludes = ConfigGlobal::Excludes;
    Options.ProgressInterval = std::chrono::milliseconds(ConfigGlobal::ProgressIntervalMs);

    if (ConfigGlobal::ShowProgress && StderrIsTerminal())
    {
        Options.ProgressSink = RenderProgress;
    }
    return Options;
}

void ControlFlow::LogSummary(const RunReport& Report) const
{
    const ProgressSnapshot& Snap = Report.Progress;
    const double Seconds = std::chrono::duration<double>(Snap.Elapsed).count();
    const double Throughput = Seconds > 0.0 ? static_cast<double>(Snap.BytesDone) / Seconds : 0.0;

    Log.Info("Found " + std::to_string(Snap.FilesTotal) + " files to process (" + FormatSize(Snap.BytesTotal) + ")");
    Log.Info("Completed hashing " + std::to_string(Report.Succeeded) + "/" + std::to_string(Report.Results.size()) + " files (" +
             FormatSize(Snap.BytesDone) + ") in " + FormatSeconds(Snap.Elapsed) + " seconds");
    Log.Info("Average throughput: " + FormatSize(Throughput) + "/s");
    if (Report.Failed != 0)
    {
        Log.Warn(std::to_string(Report.Failed) + " files could not be hashed");
    }
    Log.Debug("Peak queue depth " + std::to_string(Report.PeakQueueDepth) + " of " + std::to_string(Report.QueueCapacity));
}

int ControlFlow::WriteOutputs(const RunReport& Report, HashAlgorithm Algorithm)
{
    ManifestWriter Writer(Algorithm);
    uint64_t Rows = 0;
    std::string Error;

    if (!Writer.WriteManifestTo(Report.Results, ConfigGlobal::OutputPath, Rows, Error))
    {
        Log.Error("OutputWriteError: " + Error + "; computed hashes were not saved");
        return ExitFatal;
    }
    Log.Info("Results written to " + (ConfigGlobal::OutputPath == "-" ? std::string("standard output") : "file " + ConfigGlobal::OutputPath));

    if (!ConfigGlobal::FailureReportPath.empty())
    {
        uint64_t FailureRows = 0;
        if (!Writer.WriteFailuresTo(Report.Results, ConfigGlobal::FailureReportPath, FailureRows, Error))
        {
            Log.Error("OutputWriteError: " + Error);
            return ExitFatal;
        }
        Log.Info("Failure report (" + std::to_string(FailureRows) + " entries) written to " + ConfigGlobal::FailureReportPath);
    }
    return ExitSuccess;
}

int ControlFlow::Run(int argc, const char* const argv[])
{
    Log.SetConsole(&std::cerr);
    Log.SetConsoleBeforeWrite(ClearProgressLine);

    int Code = ExitSuccess;
    if (!Configure(argc, argv, Code))
    {
        return Code;
    }

    Log.SetMinLevel(ConfigGlobal::Verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (!ConfigGlobal::LogDir.empty() && !Log.Init(ConfigGlobal::LogDir, ConfigGlobal::MaxLogFiles))
    {
        Log.Warn("Continuing without a log file");
    }
    if (!ConfigGlobal::ConfigFile.empty())
    {
        Log.Debug("Config parsed from " + ConfigGlobal::ConfigFile);
    }

    HashOptions Options = BuildOptions();
    const HashAlgorithm Algorithm = Options.Algorithm;
    HashPipeline Pipeline(std::move(Options));

    std::atomic<bool> RunFinished{ false };
    std::thread InterruptWatcher([&Pipeline, &RunFinished]()
    {
        while (!RunFinished.load())
        {
            if (InterruptRequested.load())
            {
                Log.Info("Process interrupted by user");
                Pipeline.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    RunReport Report = Pipeline.Run();
    RunFinished = true;
    InterruptWatcher.join();

    switch (Report.Status)
    {
    case RunStatus::Success:
        break;
    case RunStatus::Cancelled:
        return ExitInterrupted;
    default:
        return ExitFatal;
    }

    LogSummary(Report);
    const int WriteCode = WriteOutputs(Report, Algorithm);
    if (!Log.CurrentLogFilePath.empty())
    {
        Log.Info("Logs saved to: " + Log.CurrentLogFilePath);
    }
    return WriteCode;
}
