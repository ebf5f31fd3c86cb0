#pragma once

#include <string>
#include <utility>
#include <vector>

// Table driven command line parser. Each recognised flag becomes a (Key, Value)
// setting; positionals are kept in order. Accepts "--name value", "--name=value"
// and "-n value".
class ArgParser
{
public:
    struct Option
    {
        std::string LongName;       // without leading dashes
        char ShortName = '\0';
        std::string Key;            // setting key the flag maps to
        bool RequiresValue = false;
        std::string FlagValue;      // value recorded for flags without an argument
        std::string ValueName;
        std::string Description;
    };

    ArgParser() = default;

    void AddOption(Option NewOption);
    bool Parse(int argc, const char* const argv[]);

    const std::vector<std::pair<std::string, std::string>>& GetSettings() const;
    const std::vector<std::string>& GetPositionals() const;
    const std::vector<std::string>& GetErrors() const;
    bool HasSetting(const std::string& Key) const;
    std::string GetSetting(const std::string& Key) const;

    std::string Usage(const std::string& Program) const;

private:
    std::vector<Option> Options;
    std::vector<std::pair<std::string, std::string>> Settings;
    std::vector<std::string> Positionals;
    std::vector<std::string> Errors;

    const Option* FindLong(const std::string& Name) const;
    const Option* FindShort(char Name) const;
};
