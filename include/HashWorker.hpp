#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "HashTypes.hpp"
#include "Hasher.hpp"
#include "TaskQueue.hpp"

class ProgressState;

constexpr size_t DefaultChunkSize = 1024 * 1024;

// Hashes files one at a time with a single reusable read buffer.
// Per-file errors become HashFailure results and never escape.
class HashWorker
{
public:
    using ResultCallback = std::function<void(HashResult&&)>;

    HashWorker(HashAlgorithm Algorithm, size_t ChunkSize, ProgressState& Progress);

    HashWorker(const HashWorker&) = delete;
    HashWorker& operator=(const HashWorker&) = delete;

    HashResult HashFile(const FileTask& Task);

    // Pulls tasks until the queue is drained after Close(), or cancelled.
    void Run(TaskQueue<FileTask>& Tasks, const ResultCallback& OnResult, const std::atomic<bool>& StopRequested);

    uint64_t FilesProcessed() const { return Processed; }

private:
    std::unique_ptr<Hasher> Digest;
    std::vector<uint8_t> Buffer;
    ProgressState& Progress;
    const std::atomic<bool>* Stop = nullptr;
    uint64_t Processed = 0;

    HashResult MakeFailure(const FileTask& Task, ErrorKind Reason, const std::string& Detail);
};
