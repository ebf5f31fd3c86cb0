#pragma once

#include <string>
#include <fstream>
#include <iosfwd>
#include <mutex>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Opens a timestamped log file under LogDir. Console output works without it.
    bool Init(const std::string& LogDir, int MaxLogFiles);
    void Close();

    void SetMinLevel(LogLevel Level);
    void SetConsole(std::ostream* Stream);

    void Log(LogLevel Level, const std::string& Message);
    void Debug(const std::string& Message);
    void Info(const std::string& Message);
    void Warn(const std::string& Message);
    void Error(const std::string& Message);

    // Sends console output through a sink that may need a cleared line first (progress bar).
    void SetConsoleBeforeWrite(void (*Hook)());

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    LogLevel MinLevel = LogLevel::INFO;
    std::ostream* Console = nullptr;
    void (*BeforeConsoleWrite)() = nullptr;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
    void CleanupOldLogs(const std::string& LogDir, int MaxLogFiles);
};

extern Logger Log;
