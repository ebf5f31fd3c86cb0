#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string RootDirectory;
    std::string ConfigFile;
    std::string OutputPath;
    std::string FailureReportPath;
    std::string Algorithm;
    std::string DiskType;
    std::string LogDir;
    std::vector<std::string> Excludes;

    long long WorkerCount;
    unsigned long long ChunkSize;
    unsigned int QueueDepthPerWorker;
    unsigned int ProgressIntervalMs;
    unsigned short int MaxLogFiles;

    bool FollowSymlinks;
    bool ShowProgress;
    bool Verbose;

    void InitializeDefaults()
    {
        RootDirectory.clear();
        ConfigFile.clear();
        OutputPath = "dir_hashes_blake2.csv"; // "-" for stdout
        FailureReportPath.clear();
        Algorithm = "blake2b";
        DiskType = "SSD";
        LogDir.clear(); // empty: console only
        Excludes.clear();
        WorkerCount = 0;
        ChunkSize = 1024 * 1024;
        QueueDepthPerWorker = 4;
        ProgressIntervalMs = 250;
        MaxLogFiles = 10;
        FollowSymlinks = true;
        ShowProgress = true;
        Verbose = false;
    }
}
