#include "ProgressState.hpp"

ProgressState::ProgressState(): Start(std::chrono::steady_clock::now())
{
}

ProgressSnapshot ProgressState::Snapshot() const
{
    ProgressSnapshot Snap;
    Snap.EnumerationComplete = EnumerationComplete.load(std::memory_order_acquire);
    Snap.BytesDone = BytesDone.load(std::memory_order_relaxed);
    Snap.BytesDiscarded = BytesDiscarded.load(std::memory_order_relaxed);
    Snap.BytesTotal = BytesTotal.load(std::memory_order_relaxed);
    Snap.FilesDone = FilesDone.load(std::memory_order_relaxed);
    Snap.FilesFailed = FilesFailed.load(std::memory_order_relaxed);
    Snap.FilesTotal = FilesTotal.load(std::memory_order_relaxed);
    Snap.Elapsed = std::chrono::steady_clock::now() - Start;
    return Snap;
}
