#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

struct ProgressSnapshot
{
    uint64_t BytesDone = 0;
    uint64_t BytesTotal = 0;
    uint64_t BytesDiscarded = 0;
    uint64_t FilesDone = 0;
    uint64_t FilesFailed = 0;
    uint64_t FilesTotal = 0;
    bool EnumerationComplete = false;
    std::chrono::steady_clock::duration Elapsed{};
};

// Counters shared by the scanner, the workers and the progress reporter.
// Only ever incremented during a run.
class ProgressState
{
public:
    ProgressState();

    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;

    void AddBytesDone(uint64_t Bytes) { BytesDone.fetch_add(Bytes, std::memory_order_relaxed); }
    void AddBytesDiscarded(uint64_t Bytes) { BytesDiscarded.fetch_add(Bytes, std::memory_order_relaxed); }
    void AddFileDone() { FilesDone.fetch_add(1, std::memory_order_relaxed); }
    void AddFileFailed() { FilesFailed.fetch_add(1, std::memory_order_relaxed); }
    void AddDiscovered(uint64_t SizeBytes)
    {
        FilesTotal.fetch_add(1, std::memory_order_relaxed);
        BytesTotal.fetch_add(SizeBytes, std::memory_order_relaxed);
    }
    // A file that grew after it was discovered adds its excess here, so BytesDone never passes BytesTotal.
    void AddBytesTotal(uint64_t Bytes) { BytesTotal.fetch_add(Bytes, std::memory_order_relaxed); }
    void MarkEnumerationComplete() { EnumerationComplete.store(true, std::memory_order_release); }

    ProgressSnapshot Snapshot() const;
    std::chrono::steady_clock::time_point StartTime() const { return Start; }

private:
    std::chrono::steady_clock::time_point Start;

    std::atomic<uint64_t> BytesDone{ 0 };
    std::atomic<uint64_t> BytesTotal{ 0 };
    std::atomic<uint64_t> BytesDiscarded{ 0 };
    std::atomic<uint64_t> FilesDone{ 0 };
    std::atomic<uint64_t> FilesFailed{ 0 };
    std::atomic<uint64_t> FilesTotal{ 0 };
    std::atomic<bool> EnumerationComplete{ false };
};
