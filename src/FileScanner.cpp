#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "FileScanner.hpp"
#include "ProgressState.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

std::string ToUtf8(const FS::path& Path)
{
    auto Temp = Path.generic_u8string();
    return std::string(Temp.begin(), Temp.end());
}

const char* ScanStatusToString(ScanStatus Status)
{
    switch (Status)
    {
    case ScanStatus::Completed:    return "Completed";
    case ScanStatus::RootNotFound: return "RootNotFound";
    case ScanStatus::RootVanished: return "RootVanished";
    case ScanStatus::Stopped:      return "Stopped";
    default:                       return "Unknown";
    }
}

FileScanner::FileScanner(ScanOptions ScanOpts): Options(std::move(ScanOpts))
{
}

bool FileScanner::CheckRoot(const std::string& RootPath, std::string& Reason)
{
    std::error_code Ec;
    FS::file_status Status = FS::status(RootPath, Ec);
    if (Ec || !FS::exists(Status))
    {
        Reason = RootPath + " does not exist";
        return false;
    }
    if (!FS::is_directory(Status))
    {
        Reason = RootPath + " is not a directory";
        return false;
    }
    return true;
}

bool FileScanner::IsExcluded(const std::string& RelativePath) const
{
    return std::find(Options.Excludes.begin(), Options.Excludes.end(), RelativePath) != Options.Excludes.end();
}

bool FileScanner::ListDirectory(const FS::path& AbsoluteDir, const FS::path& RelativeDir, DirectoryFrame& Frame, std::string& Error) const
{
    Frame.RelativeDir = RelativeDir;
    Frame.Entries.clear();
    Frame.Next = 0;

    std::error_code Ec;
    FS::directory_iterator It(AbsoluteDir, Ec);
    if (Ec)
    {
        Error = Ec.message();
        return false;
    }
    for (FS::directory_iterator End; It != End; It.increment(Ec))
    {
        if (Ec)
        {
            break;
        }
        Frame.Entries.push_back(*It);
    }
    if (Ec)
    {
        Error = Ec.message();
        return false;
    }

    std::sort(Frame.Entries.begin(), Frame.Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
        return A.path().filename().native() < B.path().filename().native();
    });
    return true;
}

bool FileScanner::EmitTask(const FS::path& AbsolutePath, const std::string& RelativePath, uint64_t Size,
                           const EntryCallback& OnEntry, ProgressState* Progress)
{
    ScanEntry Entry;
    Entry.Task.Index = NextIndex++;
    Entry.Task.RelativePath = RelativePath;
    Entry.Task.AbsolutePath = AbsolutePath.string();
    Entry.Task.SizeBytes = Size;
    if (Progress != nullptr)
    {
        Progress->AddDiscovered(Size);
    }
    return OnEntry(std::move(Entry));
}

bool FileScanner::EmitFailure(const std::string& RelativePath, const std::string& Detail,
                              const EntryCallback& OnEntry, ProgressState* Progress)
{
    ScanEntry Entry;
    Entry.Task.Index = NextIndex++;
    Entry.Task.RelativePath = RelativePath;
    Entry.Failure = HashFailure{ RelativePath, ErrorKind::FileAccess, Detail };
    if (Progress != nullptr)
    {
        Progress->AddDiscovered(0);
    }
    return OnEntry(std::move(Entry));
}

ScanStatus FileScanner::Scan(const std::string& RootPath, const EntryCallback& OnEntry, ProgressState* Progress)
{
    NextIndex = 0;

    std::string Reason;
    if (!CheckRoot(RootPath, Reason))
    {
        Log.Error("Scan: " + Reason);
        return ScanStatus::RootNotFound;
    }
    Root = FS::path(RootPath);

    std::vector<DirectoryFrame> Stack(1);
    std::string ListError;
    if (!ListDirectory(Root, FS::path(), Stack.back(), ListError))
    {
        std::error_code Ec;
        if (!FS::exists(Root, Ec))
        {
            Log.Error("Scan: Root directory vanished: " + RootPath);
            return ScanStatus::RootVanished;
        }
        Log.Warn("Cannot list directory .: " + ListError);
        bool Continue = EmitFailure(".", "cannot list directory: " + ListError, OnEntry, Progress);
        if (Progress != nullptr)
        {
            Progress->MarkEnumerationComplete();
        }
        return Continue ? ScanStatus::Completed : ScanStatus::Stopped;
    }

    while (!Stack.empty())
    {
        DirectoryFrame& Frame = Stack.back();
        if (Frame.Next >= Frame.Entries.size())
        {
            Stack.pop_back();
            continue;
        }

        // Copy out before Stack may reallocate below.
        const FS::directory_entry Entry = Frame.Entries[Frame.Next++];
        const FS::path RelativeFsPath = Frame.RelativeDir / Entry.path().filename();
        const std::string RelativePath = ToUtf8(RelativeFsPath);

        if (IsExcluded(RelativePath))
        {
            Log.Debug("Skipping excluded path: " + RelativePath);
            continue;
        }

        std::error_code Ec;
        FS::file_status LinkStatus = Entry.symlink_status(Ec);
        if (Ec)
        {
            Log.Warn("Cannot access " + RelativePath + ": " + Ec.message());
            if (!EmitFailure(RelativePath, Ec.message(), OnEntry, Progress))
            {
                return ScanStatus::Stopped;
            }
            continue;
        }

        if (FS::is_symlink(LinkStatus))
        {
            if (!Options.FollowSymlinks)
            {
                Log.Debug("Skipping symlink: " + RelativePath);
                continue;
            }
            FS::file_status TargetStatus = FS::status(Entry.path(), Ec);
            if (Ec || !FS::exists(TargetStatus))
            {
                const std::string Detail = "broken symbolic link" + (Ec ? ": " + Ec.message() : std::string());
                Log.Warn("Cannot access " + RelativePath + ": " + Detail);
                if (!EmitFailure(RelativePath, Detail, OnEntry, Progress))
                {
                    return ScanStatus::Stopped;
                }
                continue;
            }
            if (!FS::is_regular_file(TargetStatus))
            {
                Log.Debug("Not following symlink to non-regular file: " + RelativePath);
                continue;
            }
            uintmax_t Size = FS::file_size(Entry.path(), Ec);
            if (Ec)
            {
                Log.Warn("Cannot access " + RelativePath + ": " + Ec.message());
                if (!EmitFailure(RelativePath, Ec.message(), OnEntry, Progress))
                {
                    return ScanStatus::Stopped;
                }
                continue;
            }
            if (!EmitTask(Entry.path(), RelativePath, Size, OnEntry, Progress))
            {
                return ScanStatus::Stopped;
            }
            continue;
        }

        if (FS::is_directory(LinkStatus))
        {
            DirectoryFrame Child;
            if (!ListDirectory(Entry.path(), RelativeFsPath, Child, ListError))
            {
                if (!FS::exists(Root, Ec))
                {
                    Log.Error("Scan: Root directory vanished: " + RootPath);
                    return ScanStatus::RootVanished;
                }
                Log.Warn("Cannot list directory " + RelativePath + ": " + ListError);
                if (!EmitFailure(RelativePath, "cannot list directory: " + ListError, OnEntry, Progress))
                {
                    return ScanStatus::Stopped;
                }
                continue;
            }
            Stack.push_back(std::move(Child));
            continue;
        }

        if (FS::is_regular_file(LinkStatus))
        {
            uintmax_t Size = Entry.file_size(Ec);
            if (Ec)
            {
                Log.Warn("Cannot access " + RelativePath + ": " + Ec.message());
                if (!EmitFailure(RelativePath, Ec.message(), OnEntry, Progress))
                {
                    return ScanStatus::Stopped;
                }
                continue;
            }
            if (!EmitTask(Entry.path(), RelativePath, Size, OnEntry, Progress))
            {
                return ScanStatus::Stopped;
            }
            continue;
        }

        Log.Debug("Skipping special file: " + RelativePath);
    }

    if (Progress != nullptr)
    {
        Progress->MarkEnumerationComplete();
    }
    return ScanStatus::Completed;
}
