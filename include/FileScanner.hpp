#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <cstdint>

#include "HashTypes.hpp"

class ProgressState;

struct ScanOptions
{
    bool FollowSymlinks = true;             // symlinks to regular files are hashed; symlinked directories never descended
    std::vector<std::string> Excludes;      // relative paths, '/' separated
};

// Either a file to hash or a placeholder for an entry that could not be examined.
struct ScanEntry
{
    FileTask Task;
    std::optional<HashFailure> Failure;
};

enum class ScanStatus
{
    Completed,
    RootNotFound,
    RootVanished,
    Stopped
};

const char* ScanStatusToString(ScanStatus Status);

// Depth-first walk with the entries of each directory visited in file name order,
// so repeated scans of an unchanged tree produce the same sequence.
class FileScanner
{
public:
    // Returning false from the callback stops the scan.
    using EntryCallback = std::function<bool(ScanEntry&& Entry)>;

    FileScanner() = default;
    explicit FileScanner(ScanOptions Options);

    ScanStatus Scan(const std::string& RootPath, const EntryCallback& OnEntry, ProgressState* Progress = nullptr);

    // Checks that RootPath exists and is a directory.
    static bool CheckRoot(const std::string& RootPath, std::string& Reason);

    uint64_t EntryCount() const { return NextIndex; }

private:
    struct DirectoryFrame
    {
        std::filesystem::path RelativeDir;
        std::vector<std::filesystem::directory_entry> Entries;
        size_t Next = 0;
    };

    ScanOptions Options;
    std::filesystem::path Root;
    uint64_t NextIndex = 0;

    bool ListDirectory(const std::filesystem::path& AbsoluteDir, const std::filesystem::path& RelativeDir,
                       DirectoryFrame& Frame, std::string& Error) const;
    bool IsExcluded(const std::string& RelativePath) const;

    bool EmitTask(const std::filesystem::path& AbsolutePath, const std::string& RelativePath, uint64_t Size,
                  const EntryCallback& OnEntry, ProgressState* Progress);
    bool EmitFailure(const std::string& RelativePath, const std::string& Detail,
                     const EntryCallback& OnEntry, ProgressState* Progress);
};

std::string ToUtf8(const std::filesystem::path& Path);
