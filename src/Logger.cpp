#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

namespace
{
    const char* LogFilePrefix = "TreeHash_Log";
}

bool Logger::Init(const std::string& LogDir, int MaxLogFiles)
{
    std::error_code Ec;
    if (!FS::exists(LogDir, Ec))
    {
        FS::create_directories(LogDir, Ec);
        if (Ec)
        {
            Error("Logger: Failed to create log directory " + LogDir + ": " + Ec.message());
            return false;
        }
    }

    CleanupOldLogs(LogDir, MaxLogFiles);

    std::string FilePath = (FS::path(LogDir) / (LogFilePrefix + GetTimestampForFilename() + ".txt")).string();
    OpenLogFile(FilePath);
    if (!LogFile.is_open())
    {
        return false;
    }
    CurrentLogFilePath = FilePath;
    Debug("Log file opened at " + GetTimestamp());
    return true;
}

Logger::~Logger()
{
    Close();
}

void Logger::Close()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    if (LogFile.is_open())
    {
        LogFile.close();
    }
}

void Logger::SetMinLevel(LogLevel Level)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    MinLevel = Level;
}

void Logger::SetConsole(std::ostream* Stream)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    Console = Stream;
}

void Logger::SetConsoleBeforeWrite(void (*Hook)())
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    BeforeConsoleWrite = Hook;
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs(const std::string& LogDir, int MaxLogFiles)
{
    std::vector<FS::directory_entry> Logs;
    std::error_code Ec;

    for (const auto& Entry : FS::directory_iterator(LogDir, Ec))
    {
        if (Entry.is_regular_file(Ec) && Entry.path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(Entry);
        }
    }

    // Leave room for the file about to be opened.
    const size_t Keep = MaxLogFiles > 0 ? static_cast<size_t>(MaxLogFiles - 1) : 0;
    if (Logs.size() <= Keep)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while (Logs.size() > Keep)
    {
        if (!FS::remove(Logs.front().path(), Ec) && Ec)
        {
            Warn("Logger: Could not remove old log " + Logs.front().path().string() + ": " + Ec.message());
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (Level < MinLevel)
    {
        return;
    }

    const std::string Line = "[" + GetTimestamp() + "] [" + LevelToString(Level) + "] " + Message + "\n";

    if (Console != nullptr)
    {
        if (BeforeConsoleWrite != nullptr)
        {
            BeforeConsoleWrite();
        }
        *Console << Line;
        Console->flush();
    }

    if (LogFile.is_open())
    {
        LogFile << Line;
        LogFile.flush();
    }
}

void Logger::Debug(const std::string& Message)
{
    Log(LogLevel::DEBUG, Message);
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
