#pragma once

#include <string>

#include "ArgParser.hpp"
#include "ConfigParser.hpp"
#include "HashPipeline.hpp"

// Exit codes of the command line tool.
enum ExitCode
{
    ExitSuccess = 0,
    ExitFatal = 1,
    ExitUsage = 2,
    ExitInterrupted = 130
};

class ControlFlow
{
public:
    ControlFlow();

    int Run(int argc, const char* const argv[]);

    // Async-signal-safe; the active run is cancelled shortly after.
    static void RequestInterrupt();

private:
    ArgParser Args;
    ConfigParser Parser;

    bool Configure(int argc, const char* const argv[], int& Code);
    HashOptions BuildOptions() const;
    int WriteOutputs(const RunReport& Report, HashAlgorithm Algorithm);
    void LogSummary(const RunReport& Report) const;
};
