#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>

enum class ErrorKind
{
    FileAccess,
    FileRead
};

inline const char* ErrorKindToString(ErrorKind Kind)
{
    switch (Kind)
    {
    case ErrorKind::FileAccess: return "FileAccessError";
    case ErrorKind::FileRead:   return "FileReadError";
    default:                    return "UnknownError";
    }
}

// One regular file found by the scanner. Index is its position in enumeration order.
struct FileTask
{
    uint64_t Index = 0;
    std::string RelativePath;
    std::string AbsolutePath;
    uint64_t SizeBytes = 0;
};

struct HashSuccess
{
    std::string RelativePath;
    std::vector<uint8_t> Digest;
    uint64_t SizeBytes = 0;
};

struct HashFailure
{
    std::string RelativePath;
    ErrorKind Reason = ErrorKind::FileAccess;
    std::string Detail;
};

struct HashResult
{
    uint64_t Index = 0;
    std::variant<HashSuccess, HashFailure> Outcome;

    bool IsSuccess() const { return std::holds_alternative<HashSuccess>(Outcome); }
    const HashSuccess& Success() const { return std::get<HashSuccess>(Outcome); }
    const HashFailure& Failure() const { return std::get<HashFailure>(Outcome); }

    const std::string& RelativePath() const
    {
        return IsSuccess() ? Success().RelativePath : Failure().RelativePath;
    }
};

// Results of one run in enumeration order.
using RunResult = std::vector<HashResult>;
