#include "ManifestWriter.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <cstdio>
#include <fcntl.h>
#include <io.h>
#endif

namespace FS = std::filesystem;

namespace
{
    const char* LineEnd = "\r\n";
}

ManifestWriter::ManifestWriter(HashAlgorithm Algorithm): HashColumn(ManifestHashColumn(Algorithm))
{
}

std::string ManifestWriter::EscapeField(const std::string& Field)
{
    if (Field.find_first_of(",\"\r\n") == std::string::npos)
    {
        return Field;
    }

    std::string Quoted;
    Quoted.reserve(Field.size() + 2);
    Quoted.push_back('"');
    for (char Ch : Field)
    {
        if (Ch == '"')
        {
            Quoted.push_back('"');
        }
        Quoted.push_back(Ch);
    }
    Quoted.push_back('"');
    return Quoted;
}

uint64_t ManifestWriter::WriteManifest(const RunResult& Results, std::ostream& Out) const
{
    Out << "File Path," << EscapeField(HashColumn) << LineEnd;

    uint64_t Rows = 0;
    for (const HashResult& Result : Results)
    {
        if (!Result.IsSuccess())
        {
            continue;
        }
        const HashSuccess& Success = Result.Success();
        Out << EscapeField(Success.RelativePath) << ',' << ToHex(Success.Digest) << LineEnd;
        ++Rows;
    }
    return Rows;
}

uint64_t ManifestWriter::WriteFailures(const RunResult& Results, std::ostream& Out) const
{
    Out << "File Path,Error Kind,Detail" << LineEnd;

    uint64_t Rows = 0;
    for (const HashResult& Result : Results)
    {
        if (Result.IsSuccess())
        {
            continue;
        }
        const HashFailure& Failure = Result.Failure();
        Out << EscapeField(Failure.RelativePath) << ',' << ErrorKindToString(Failure.Reason) << ','
            << EscapeField(Failure.Detail) << LineEnd;
        ++Rows;
    }
    return Rows;
}

template <typename WriteFn>
bool ManifestWriter::WriteTo(const std::string& Destination, WriteFn&& Write, std::string& Error) const
{
    if (Destination == "-")
    {
#ifdef _WIN32
        // Text mode stdout would turn every "\r\n" row ending into "\r\r\n".
        std::cout.flush();
        _setmode(_fileno(stdout), _O_BINARY);
#endif
        Write(std::cout);
        std::cout.flush();
        if (!std::cout)
        {
            Error = "failed writing to standard output";
            return false;
        }
        return true;
    }

    const FS::path Target(Destination);
    const FS::path Temp(Destination + ".tmp");
    {
        std::ofstream File(Temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!File.is_open())
        {
            Error = "cannot open " + Temp.string() + " for writing: " + std::error_code(errno, std::generic_category()).message();
            return false;
        }
        Write(File);
        File.flush();
        if (!File)
        {
            Error = "failed writing " + Temp.string();
            File.close();
            std::error_code Ignored;
            FS::remove(Temp, Ignored);
            return false;
        }
    }

    std::error_code Ec;
    FS::rename(Temp, Target, Ec);
    if (Ec)
    {
        Error = "cannot move " + Temp.string() + " to " + Target.string() + ": " + Ec.message();
        std::error_code Ignored;
        FS::remove(Temp, Ignored);
        return false;
    }
    return true;
}

bool ManifestWriter::WriteManifestTo(const RunResult& Results, const std::string& Destination, uint64_t& Rows, std::string& Error) const
{
    Rows = 0;
    return WriteTo(Destination, [&](std::ostream& Out) { Rows = WriteManifest(Results, Out); }, Error);
}

bool ManifestWriter::WriteFailuresTo(const RunResult& Results, const std::string& Destination, uint64_t& Rows, std::string& Error) const
{
    Rows = 0;
    return WriteTo(Destination, [&](std::ostream& Out) { Rows = WriteFailures(Results, Out); }, Error);
}
