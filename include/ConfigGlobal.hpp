#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace ConfigGlobal
{
    extern std::string RootDirectory;
    extern std::string ConfigFile;
    extern std::string OutputPath;
    extern std::string FailureReportPath;
    extern std::string Algorithm;
    extern std::string DiskType;
    extern std::string LogDir;
    extern std::vector<std::string> Excludes;

    extern long long WorkerCount;           // 0 = pick from DiskType
    extern unsigned long long ChunkSize;
    extern unsigned int QueueDepthPerWorker;
    extern unsigned int ProgressIntervalMs;
    extern unsigned short int MaxLogFiles;

    extern bool FollowSymlinks;
    extern bool ShowProgress;
    extern bool Verbose;

    void InitializeDefaults();
}
