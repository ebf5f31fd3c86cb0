#include "ResultAggregator.hpp"
#include "Logger.hpp"

void ResultAggregator::Submit(HashResult&& Result)
{
    {
        std::lock_guard<std::mutex> Lock(AggregatorMutex);
        const uint64_t Index = Result.Index;
        if (Index < NextIndex || Pending.count(Index) != 0)
        {
            ++Duplicates;
            Log.Error("[ResultAggregator] Duplicate result for index " + std::to_string(Index) + ": " + Result.RelativePath());
            return;
        }
        Pending.emplace(Index, std::move(Result));
        if (Pending.size() > PeakPending)
        {
            PeakPending = Pending.size();
        }
        if (Index != NextIndex)
        {
            return;
        }
    }
    Ready_CV.notify_all();
}

void ResultAggregator::SetExpectedCount(uint64_t Count)
{
    {
        std::lock_guard<std::mutex> Lock(AggregatorMutex);
        Expected = Count;
    }
    Ready_CV.notify_all();
}

std::optional<HashResult> ResultAggregator::Next()
{
    std::unique_lock<std::mutex> Lock(AggregatorMutex);
    Ready_CV.wait(Lock, [this]()
    {
        return Aborted || (Expected && NextIndex >= *Expected) || (!Pending.empty() && Pending.begin()->first == NextIndex);
    });

    if (Aborted || Pending.empty() || Pending.begin()->first != NextIndex)
    {
        return std::nullopt;
    }

    auto It = Pending.begin();
    HashResult Result = std::move(It->second);
    Pending.erase(It);
    ++NextIndex;
    return Result;
}

void ResultAggregator::Abort()
{
    {
        std::lock_guard<std::mutex> Lock(AggregatorMutex);
        Aborted = true;
    }
    Ready_CV.notify_all();
}

bool ResultAggregator::Verify(uint64_t EnumeratedCount, std::string& Error) const
{
    std::lock_guard<std::mutex> Lock(AggregatorMutex);
    if (Duplicates != 0)
    {
        Error = std::to_string(Duplicates) + " duplicate results received";
        return false;
    }
    if (!Pending.empty())
    {
        Error = std::to_string(Pending.size()) + " results left unreleased after index " + std::to_string(NextIndex);
        return false;
    }
    if (NextIndex != EnumeratedCount)
    {
        Error = "released " + std::to_string(NextIndex) + " results for " + std::to_string(EnumeratedCount) + " enumerated entries";
        return false;
    }
    return true;
}

uint64_t ResultAggregator::Released() const
{
    std::lock_guard<std::mutex> Lock(AggregatorMutex);
    return NextIndex;
}

size_t ResultAggregator::Buffered() const
{
    std::lock_guard<std::mutex> Lock(AggregatorMutex);
    return Pending.size();
}

size_t ResultAggregator::PeakBuffered() const
{
    std::lock_guard<std::mutex> Lock(AggregatorMutex);
    return PeakPending;
}
