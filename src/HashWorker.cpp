#include "HashWorker.hpp"
#include "ProgressState.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <exception>
#include <string>
#include <utility>
#include <system_error>
#include <fcntl.h>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace
{
#ifdef _WIN32
    int OpenForRead(const char* Path) { return _open(Path, _O_RDONLY | _O_BINARY); }
    long long ReadSome(int Fd, void* Data, size_t Length) { return _read(Fd, Data, static_cast<unsigned int>(Length)); }
    void CloseFd(int Fd) { _close(Fd); }
#else
    int OpenForRead(const char* Path) { return ::open(Path, O_RDONLY | O_CLOEXEC); }
    long long ReadSome(int Fd, void* Data, size_t Length) { return ::read(Fd, Data, Length); }
    void CloseFd(int Fd) { ::close(Fd); }
#endif

    // Owns one open descriptor; a worker never holds more than one.
    class ScopedFile
    {
    public:
        explicit ScopedFile(const std::string& Path)
        {
            do
            {
                Fd = OpenForRead(Path.c_str());
            } while (Fd < 0 && errno == EINTR);
            OpenErrno = Fd < 0 ? errno : 0;
        }
        ~ScopedFile()
        {
            if (Fd >= 0)
            {
                CloseFd(Fd);
            }
        }
        ScopedFile(const ScopedFile&) = delete;
        ScopedFile& operator=(const ScopedFile&) = delete;

        bool IsOpen() const { return Fd >= 0; }
        int Error() const { return OpenErrno; }

        // Returns bytes read, 0 at end of file, -1 with ErrnoOut set on error.
        long long Read(uint8_t* Data, size_t Length, int& ErrnoOut)
        {
            long long Count;
            do
            {
                Count = ReadSome(Fd, Data, Length);
            } while (Count < 0 && errno == EINTR);
            ErrnoOut = Count < 0 ? errno : 0;
            return Count;
        }

    private:
        int Fd = -1;
        int OpenErrno = 0;
    };

    std::string DescribeOpenError(int Errno)
    {
        switch (Errno)
        {
        case EACCES:
        case EPERM:  return "permission denied";
        case ENOENT: return "not found";
        case ELOOP:  return "too many levels of symbolic links";
        case EISDIR: return "is a directory";
        default:     return std::error_code(Errno, std::generic_category()).message();
        }
    }
}

HashWorker::HashWorker(HashAlgorithm Algorithm, size_t ChunkSize, ProgressState& ProgressCounters)
    : Digest(MakeHasher(Algorithm)), Buffer(ChunkSize == 0 ? DefaultChunkSize : ChunkSize), Progress(ProgressCounters)
{
}

HashResult HashWorker::MakeFailure(const FileTask& Task, ErrorKind Reason, const std::string& Detail)
{
    Log.Warn(std::string(ErrorKindToString(Reason)) + ": " + Task.RelativePath + " (" + Detail + ")");
    Progress.AddFileFailed();

    HashResult Result;
    Result.Index = Task.Index;
    Result.Outcome = HashFailure{ Task.RelativePath, Reason, Detail };
    return Result;
}

HashResult HashWorker::HashFile(const FileTask& Task)
{
    ++Processed;

    ScopedFile File(Task.AbsolutePath);
    if (!File.IsOpen())
    {
        return MakeFailure(Task, ErrorKind::FileAccess, DescribeOpenError(File.Error()));
    }

    Digest->Init();
    uint64_t TotalRead = 0;
    uint64_t Accounted = Task.SizeBytes;
    while (true)
    {
        if (Stop != nullptr && Stop->load(std::memory_order_relaxed))
        {
            Progress.AddBytesDiscarded(TotalRead);
            return MakeFailure(Task, ErrorKind::FileRead, "cancelled");
        }

        int ReadErrno = 0;
        long long Count = File.Read(Buffer.data(), Buffer.size(), ReadErrno);
        if (Count < 0)
        {
            Progress.AddBytesDiscarded(TotalRead);
            return MakeFailure(Task, ErrorKind::FileRead, std::error_code(ReadErrno, std::generic_category()).message());
        }
        if (Count == 0)
        {
            break;
        }
        Digest->Update(Buffer.data(), static_cast<size_t>(Count));
        TotalRead += static_cast<uint64_t>(Count);
        if (TotalRead > Accounted)
        {
            Progress.AddBytesTotal(TotalRead - Accounted);
            Accounted = TotalRead;
        }
        Progress.AddBytesDone(static_cast<uint64_t>(Count));
    }

    HashResult Result;
    Result.Index = Task.Index;
    Result.Outcome = HashSuccess{ Task.RelativePath, Digest->Finalize(), TotalRead };
    Progress.AddFileDone();
    Log.Debug("Hashed " + Task.RelativePath + " (" + std::to_string(TotalRead) + " bytes)");
    return Result;
}

void HashWorker::Run(TaskQueue<FileTask>& Tasks, const ResultCallback& OnResult, const std::atomic<bool>& StopRequested)
{
    Stop = &StopRequested;
    while (!StopRequested.load(std::memory_order_relaxed))
    {
        std::optional<FileTask> Task = Tasks.Pop();
        if (!Task)
        {
            break;
        }
        HashResult Result;
        try
        {
            Result = HashFile(*Task);
        }
        catch (const std::exception& e)
        {
            Result = MakeFailure(*Task, ErrorKind::FileRead, e.what());
        }
        OnResult(std::move(Result));
    }
    Stop = nullptr;
}
