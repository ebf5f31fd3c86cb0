#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "Hasher.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string Trim(const std::string& Text)
    {
        std::string Out = Text;
        Out.erase(Out.begin(), std::find_if(Out.begin(), Out.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Out.erase(std::find_if(Out.rbegin(), Out.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Out.end());
        return Out;
    }

    std::string ToLower(std::string Text)
    {
        std::transform(Text.begin(), Text.end(), Text.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Text;
    }

    std::string NormalizeExclude(std::string Value)
    {
        std::replace(Value.begin(), Value.end(), '\\', '/');
        while (Value.size() > 2 && Value.compare(0, 2, "./") == 0)
        {
            Value.erase(0, 2);
        }
        while (!Value.empty() && Value.back() == '/')
        {
            Value.pop_back();
        }
        return Value;
    }
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::ParseBool(const std::string& Value, bool& Out)
{
    const std::string Lower = ToLower(Value);
    if (Lower == "true" || Lower == "yes" || Lower == "on" || Lower == "1")
    {
        Out = true;
        return true;
    }
    if (Lower == "false" || Lower == "no" || Lower == "off" || Lower == "0")
    {
        Out = false;
        return true;
    }
    return false;
}

bool ConfigParser::ParseUnsigned(const std::string& Value, unsigned long long& Out)
{
    if (Value.empty() || !std::all_of(Value.begin(), Value.end(), [](char Ch) { return std::isdigit(static_cast<unsigned char>(Ch)); }))
    {
        return false;
    }
    try
    {
        Out = std::stoull(Value);
    }
    catch (const std::out_of_range&)
    {
        return false;
    }
    return true;
}

bool ConfigParser::ParseSigned(const std::string& Value, long long& Out)
{
    if (Value.empty())
    {
        return false;
    }
    size_t Start = (Value[0] == '-' || Value[0] == '+') ? 1 : 0;
    if (Start == Value.size() || !std::all_of(Value.begin() + Start, Value.end(), [](char Ch) { return std::isdigit(static_cast<unsigned char>(Ch)); }))
    {
        return false;
    }
    try
    {
        Out = std::stoll(Value);
    }
    catch (const std::out_of_range&)
    {
        return false;
    }
    return true;
}

bool ConfigParser::ApplySetting(const std::string& Key, const std::string& Value, const std::string& Where)
{
    unsigned long long Number = 0;
    bool Flag = false;

    if (Key == "Workers")
    {
        long long Signed = 0;
        if (!ParseSigned(Value, Signed))
        {
            AddError(Where + ": Workers must be an integer.");
            return false;
        }
        if (Signed < 1)
        {
            AddError(Where + ": Workers must be at least 1.");
            return false;
        }
        ConfigGlobal::WorkerCount = Signed;
    }
    else if (Key == "Output")
    {
        if (Value.empty())
        {
            AddError(Where + ": Output must not be empty.");
            return false;
        }
        ConfigGlobal::OutputPath = Value;
    }
    else if (Key == "FailureReport")
    {
        ConfigGlobal::FailureReportPath = Value;
    }
    else if (Key == "Algorithm")
    {
        HashAlgorithm Parsed;
        if (!ParseHashAlgorithm(Value, Parsed))
        {
            AddError(Where + ": Unknown Algorithm '" + Value + "' (expected blake2b or blake3).");
            return false;
        }
        ConfigGlobal::Algorithm = HashAlgorithmName(Parsed);
    }
    else if (Key == "ChunkSize")
    {
        if (!ParseUnsigned(Value, Number) || Number == 0)
        {
            AddError(Where + ": ChunkSize must be a positive number of bytes.");
            return false;
        }
        ConfigGlobal::ChunkSize = Number;
    }
    else if (Key == "DiskType")
    {
        std::string Upper = Value;
        std::transform(Upper.begin(), Upper.end(), Upper.begin(), [](unsigned char Ch) { return static_cast<char>(std::toupper(Ch)); });
        if (Upper != "SSD" && Upper != "HDD")
        {
            AddError(Where + ": DiskType must be SSD or HDD.");
            return false;
        }
        ConfigGlobal::DiskType = Upper;
    }
    else if (Key == "QueueDepthPerWorker")
    {
        if (!ParseUnsigned(Value, Number) || Number == 0 || Number > 1024)
        {
            AddError(Where + ": QueueDepthPerWorker must be between 1 and 1024.");
            return false;
        }
        ConfigGlobal::QueueDepthPerWorker = static_cast<unsigned int>(Number);
    }
    else if (Key == "ProgressIntervalMs")
    {
        if (!ParseUnsigned(Value, Number) || Number < 20 || Number > 60000)
        {
            AddError(Where + ": ProgressIntervalMs must be between 20 and 60000.");
            return false;
        }
        ConfigGlobal::ProgressIntervalMs = static_cast<unsigned int>(Number);
    }
    else if (Key == "FollowSymlinks" || Key == "ShowProgress" || Key == "Verbose")
    {
        if (!ParseBool(Value, Flag))
        {
            AddError(Where + ": " + Key + " must be true or false.");
            return false;
        }
        if (Key == "FollowSymlinks")
            ConfigGlobal::FollowSymlinks = Flag;
        else if (Key == "ShowProgress")
            ConfigGlobal::ShowProgress = Flag;
        else
            ConfigGlobal::Verbose = Flag;
    }
    else if (Key == "Exclude")
    {
        const std::string Normalized = NormalizeExclude(Value);
        if (Normalized.empty() || FS::path(Normalized).is_absolute())
        {
            AddError(Where + ": Exclude must be a path relative to the hashed directory.");
            return false;
        }
        if (std::find(ConfigGlobal::Excludes.begin(), ConfigGlobal::Excludes.end(), Normalized) != ConfigGlobal::Excludes.end())
        {
            AddInfo(Where + ": Duplicate exclude '" + Normalized + "'. Ignored.");
            return true;
        }
        ConfigGlobal::Excludes.push_back(Normalized);
    }
    else if (Key == "LogDir")
    {
        ConfigGlobal::LogDir = Value;
    }
    else if (Key == "MaxLogFiles")
    {
        if (!ParseUnsigned(Value, Number) || Number == 0 || Number > 1000)
        {
            AddError(Where + ": MaxLogFiles must be between 1 and 1000.");
            return false;
        }
        ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(Number);
    }
    else
    {
        AddError(Where + ": Unknown key '" + Key + "'.");
        return false;
    }
    return true;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!FS::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    const size_t ErrorsBefore = Errors.size();
    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        Line = Trim(Line);
        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        const size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        const std::string Value = Trim(Line.substr(EqualPos + 1));

        ApplySetting(Key, Value, "Line " + std::to_string(LineNumber));
    }

    return Errors.size() == ErrorsBefore;
}
