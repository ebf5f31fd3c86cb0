#pragma once

#include <string>
#include <vector>

// Reads "Key = Value" lines into ConfigGlobal. Problems are collected per line
// rather than stopping at the first one.
class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    // Applies a single setting; shared with the command line parser.
    bool ApplySetting(const std::string& Key, const std::string& Value, const std::string& Where);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

    static bool ParseBool(const std::string& Value, bool& Out);
    static bool ParseUnsigned(const std::string& Value, unsigned long long& Out);
    static bool ParseSigned(const std::string& Value, long long& Out);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
