#include "HashWorker.hpp"
#include "ProgressState.hpp"
#include "TestUtils.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using TestUtils::TempDir;
using TestUtils::WriteFile;
namespace FS = std::filesystem;

namespace
{
    FileTask MakeTask(const TempDir& Dir, const std::string& Name, uint64_t Index)
    {
        FileTask Task;
        Task.Index = Index;
        Task.RelativePath = Name;
        Task.AbsolutePath = (Dir.Root() / Name).string();
        std::error_code Ec;
        Task.SizeBytes = FS::file_size(Dir.Root() / Name, Ec);
        return Task;
    }
}

TEST_CASE("Worker hashes a file in chunks and counts bytes", "[worker]")
{
    TempDir Dir;
    const std::string Data = TestUtils::Pattern(100000, 11);
    WriteFile(Dir.Root() / "data.bin", Data);

    ProgressState Progress;
    HashWorker Worker(HashAlgorithm::Blake2b, 4096, Progress);
    HashResult Result = Worker.HashFile(MakeTask(Dir, "data.bin", 5));

    REQUIRE(Result.Index == 5);
    REQUIRE(Result.IsSuccess());
    REQUIRE(Result.Success().RelativePath == "data.bin");
    REQUIRE(Result.Success().SizeBytes == Data.size());
    REQUIRE(ToHex(Result.Success().Digest) == TestUtils::ReferenceBlake2b(Data));

    ProgressSnapshot Snap = Progress.Snapshot();
    REQUIRE(Snap.BytesDone == Data.size());
    REQUIRE(Snap.FilesDone == 1);
    REQUIRE(Snap.FilesFailed == 0);
}

TEST_CASE("Worker hashes an empty file to the empty-input digest", "[worker]")
{
    TempDir Dir;
    WriteFile(Dir.Root() / "empty", "");

    ProgressState Progress;
    HashWorker Worker(HashAlgorithm::Blake2b, DefaultChunkSize, Progress);
    HashResult Result = Worker.HashFile(MakeTask(Dir, "empty", 0));

    REQUIRE(Result.IsSuccess());
    REQUIRE(Result.Success().SizeBytes == 0);
    REQUIRE(ToHex(Result.Success().Digest) == TestUtils::ReferenceBlake2b(""));
}

TEST_CASE("Worker turns open errors into FileAccess failures", "[worker][errors]")
{
    TempDir Dir;
    ProgressState Progress;
    HashWorker Worker(HashAlgorithm::Blake2b, DefaultChunkSize, Progress);

    SECTION("file deleted after enumeration")
    {
        FileTask Task;
        Task.Index = 3;
        Task.RelativePath = "gone.txt";
        Task.AbsolutePath = (Dir.Root() / "gone.txt").string();

        HashResult Result = Worker.HashFile(Task);
        REQUIRE_FALSE(Result.IsSuccess());
        REQUIRE(Result.Index == 3);
        REQUIRE(Result.Failure().Reason == ErrorKind::FileAccess);
        REQUIRE(Result.Failure().Detail == "not found");
        REQUIRE(Progress.Snapshot().FilesFailed == 1);
        REQUIRE(Progress.Snapshot().BytesDone == 0);
    }

    SECTION("permission denied")
    {
        WriteFile(Dir.Root() / "secret", "top secret");
        FS::permissions(Dir.Root() / "secret", FS::perms::none);
        if (!TestUtils::PermissionsEnforced(Dir.Root() / "secret"))
        {
            WARN("permissions are not enforced for this user; skipping");
            return;
        }
        HashResult Result = Worker.HashFile(MakeTask(Dir, "secret", 0));
        REQUIRE_FALSE(Result.IsSuccess());
        REQUIRE(Result.Failure().Reason == ErrorKind::FileAccess);
        REQUIRE(Result.Failure().Detail == "permission denied");
    }
}

TEST_CASE("A file that grew since enumeration raises the byte total", "[worker][progress]")
{
    TempDir Dir;
    WriteFile(Dir.Root() / "growing.log", "0123456789");

    ProgressState Progress;
    FileTask Task = MakeTask(Dir, "growing.log", 0);
    Progress.AddDiscovered(Task.SizeBytes);
    REQUIRE(Task.SizeBytes == 10);

    const std::string Grown = TestUtils::Pattern(50000, 21);
    WriteFile(Dir.Root() / "growing.log", Grown);

    HashWorker Worker(HashAlgorithm::Blake2b, 4096, Progress);
    HashResult Result = Worker.HashFile(Task);

    REQUIRE(Result.IsSuccess());
    REQUIRE(Result.Success().SizeBytes == Grown.size());
    REQUIRE(ToHex(Result.Success().Digest) == TestUtils::ReferenceBlake2b(Grown));

    ProgressSnapshot Snap = Progress.Snapshot();
    REQUIRE(Snap.BytesDone == Grown.size());
    REQUIRE(Snap.BytesTotal == Grown.size());
    REQUIRE(Snap.BytesDone <= Snap.BytesTotal);
}

TEST_CASE("A file that shrank since enumeration leaves the total untouched", "[worker][progress]")
{
    TempDir Dir;
    WriteFile(Dir.Root() / "shrinking.bin", TestUtils::Pattern(8000, 4));

    ProgressState Progress;
    FileTask Task = MakeTask(Dir, "shrinking.bin", 0);
    Progress.AddDiscovered(Task.SizeBytes);
    WriteFile(Dir.Root() / "shrinking.bin", "tiny");

    HashWorker Worker(HashAlgorithm::Blake2b, 4096, Progress);
    REQUIRE(Worker.HashFile(Task).IsSuccess());

    ProgressSnapshot Snap = Progress.Snapshot();
    REQUIRE(Snap.BytesDone == 4);
    REQUIRE(Snap.BytesTotal == 8000);
}

TEST_CASE("Reading a directory is a FileRead failure with nothing counted", "[worker][errors]")
{
    TempDir Dir;
    FS::create_directories(Dir.Root() / "adir");

    ProgressState Progress;
    HashWorker Worker(HashAlgorithm::Blake2b, DefaultChunkSize, Progress);
    FileTask Task;
    Task.RelativePath = "adir";
    Task.AbsolutePath = (Dir.Root() / "adir").string();

    // open(O_RDONLY) succeeds on a directory on POSIX; read() then fails with EISDIR.
    HashResult Result = Worker.HashFile(Task);
    REQUIRE_FALSE(Result.IsSuccess());
    REQUIRE(Progress.Snapshot().BytesDone == Progress.Snapshot().BytesDiscarded);
}

TEST_CASE("Worker loop drains the queue and reports every task", "[worker][queue]")
{
    TempDir Dir;
    for (int i = 0; i < 20; ++i)
    {
        WriteFile(Dir.Root() / ("f" + std::to_string(i)), TestUtils::Pattern(1000 + i, i));
    }

    ProgressState Progress;
    TaskQueue<FileTask> Tasks(4);
    std::atomic<bool> Stop{ false };
    std::vector<HashResult> Results;
    std::mutex ResultsMutex;
    uint64_t Processed = 0;

    std::thread Consumer([&]()
    {
        HashWorker Worker(HashAlgorithm::Blake3, DefaultChunkSize, Progress);
        Worker.Run(Tasks, [&](HashResult&& Result)
        {
            std::lock_guard<std::mutex> Lock(ResultsMutex);
            Results.push_back(std::move(Result));
        }, Stop);
        Processed = Worker.FilesProcessed();
    });

    for (int i = 0; i < 20; ++i)
    {
        REQUIRE(Tasks.Push(MakeTask(Dir, "f" + std::to_string(i), static_cast<uint64_t>(i))));
    }
    FileTask Missing;
    Missing.Index = 20;
    Missing.RelativePath = "missing";
    Missing.AbsolutePath = (Dir.Root() / "missing").string();
    REQUIRE(Tasks.Push(Missing));
    Tasks.Close();
    Consumer.join();

    REQUIRE(Results.size() == 21);
    REQUIRE(Processed == 21);
    uint64_t SuccessBytes = 0;
    for (const auto& Result : Results)
    {
        if (Result.IsSuccess())
        {
            SuccessBytes += Result.Success().SizeBytes;
            REQUIRE(Result.Success().Digest.size() == 32);
        }
    }
    ProgressSnapshot Snap = Progress.Snapshot();
    REQUIRE(Snap.FilesDone == 20);
    REQUIRE(Snap.FilesFailed == 1);
    REQUIRE(Snap.BytesDone == SuccessBytes);
}

TEST_CASE("Worker stops pulling tasks once stop is requested", "[worker][cancel]")
{
    TempDir Dir;
    WriteFile(Dir.Root() / "a", "a");

    ProgressState Progress;
    TaskQueue<FileTask> Tasks(8);
    REQUIRE(Tasks.Push(MakeTask(Dir, "a", 0)));
    std::atomic<bool> Stop{ true };

    HashWorker Worker(HashAlgorithm::Blake2b, DefaultChunkSize, Progress);
    size_t Delivered = 0;
    Worker.Run(Tasks, [&Delivered](HashResult&&) { ++Delivered; }, Stop);

    REQUIRE(Delivered == 0);
    REQUIRE(Tasks.Size() == 1);
}
