#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

// "4.20 MB" style, binary multiples.
inline std::string FormatSize(double Bytes)
{
    static const char* Units[] = { "B", "KB", "MB", "GB", "TB" };
    char Buffer[32];
    for (const char* Unit : Units)
    {
        if (Bytes < 1024.0)
        {
            std::snprintf(Buffer, sizeof(Buffer), "%.2f %s", Bytes, Unit);
            return Buffer;
        }
        Bytes /= 1024.0;
    }
    std::snprintf(Buffer, sizeof(Buffer), "%.2f PB", Bytes);
    return Buffer;
}

inline std::string FormatSize(uint64_t Bytes)
{
    return FormatSize(static_cast<double>(Bytes));
}

// "1:02:03" or "02:03".
inline std::string FormatDuration(std::chrono::seconds Duration)
{
    long long Total = Duration.count();
    if (Total < 0)
    {
        Total = 0;
    }
    const long long Hours = Total / 3600;
    const long long Minutes = (Total % 3600) / 60;
    const long long Seconds = Total % 60;

    char Buffer[32];
    if (Hours > 0)
    {
        std::snprintf(Buffer, sizeof(Buffer), "%lld:%02lld:%02lld", Hours, Minutes, Seconds);
    }
    else
    {
        std::snprintf(Buffer, sizeof(Buffer), "%02lld:%02lld", Minutes, Seconds);
    }
    return Buffer;
}

inline std::string FormatSeconds(std::chrono::steady_clock::duration Elapsed)
{
    char Buffer[32];
    std::snprintf(Buffer, sizeof(Buffer), "%.2f", std::chrono::duration<double>(Elapsed).count());
    return Buffer;
}
