#pragma once

#include <map>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include <cstdint>

#include "HashTypes.hpp"

// Reorder buffer keyed by enumeration index. Results arrive in completion order
// from any thread and are released by Next() strictly in increasing index order.
class ResultAggregator
{
public:
    ResultAggregator() = default;

    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    void Submit(HashResult&& Result);

    // Total number of results to expect; known once enumeration has finished.
    void SetExpectedCount(uint64_t Count);

    // Blocks until the next result in order is available. Returns std::nullopt once
    // every expected result has been released, or after Abort().
    std::optional<HashResult> Next();

    void Abort();

    // Cross-checks the released results against the enumerated count.
    bool Verify(uint64_t EnumeratedCount, std::string& Error) const;

    uint64_t Released() const;
    size_t Buffered() const;
    size_t PeakBuffered() const;

private:
    mutable std::mutex AggregatorMutex;
    std::condition_variable Ready_CV;

    std::map<uint64_t, HashResult> Pending;
    uint64_t NextIndex = 0;
    std::optional<uint64_t> Expected;
    uint64_t Duplicates = 0;
    size_t PeakPending = 0;
    bool Aborted = false;
};
