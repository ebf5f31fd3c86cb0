#pragma once

#include <iosfwd>
#include <string>
#include <cstdint>

#include "HashTypes.hpp"
#include "Hasher.hpp"

// Serialises a RunResult as CSV with minimal quoting and CRLF line endings.
class ManifestWriter
{
public:
    explicit ManifestWriter(HashAlgorithm Algorithm);

    // Writes the header and one row per successful result. Returns the row count.
    uint64_t WriteManifest(const RunResult& Results, std::ostream& Out) const;
    uint64_t WriteFailures(const RunResult& Results, std::ostream& Out) const;

    // "-" means standard output. Files are written to "<path>.tmp" and renamed into
    // place, so a failed write never leaves a partial manifest behind.
    bool WriteManifestTo(const RunResult& Results, const std::string& Destination, uint64_t& Rows, std::string& Error) const;
    bool WriteFailuresTo(const RunResult& Results, const std::string& Destination, uint64_t& Rows, std::string& Error) const;

    static std::string EscapeField(const std::string& Field);

private:
    std::string HashColumn;

    template <typename WriteFn>
    bool WriteTo(const std::string& Destination, WriteFn&& Write, std::string& Error) const;
};
