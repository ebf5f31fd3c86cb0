#include "ArgParser.hpp"

#include <algorithm>
#include <sstream>

void ArgParser::AddOption(Option NewOption)
{
    Options.push_back(std::move(NewOption));
}

const ArgParser::Option* ArgParser::FindLong(const std::string& Name) const
{
    auto It = std::find_if(Options.begin(), Options.end(), [&Name](const Option& Opt) { return Opt.LongName == Name; });
    return It == Options.end() ? nullptr : &*It;
}

const ArgParser::Option* ArgParser::FindShort(char Name) const
{
    auto It = std::find_if(Options.begin(), Options.end(), [Name](const Option& Opt) { return Opt.ShortName != '\0' && Opt.ShortName == Name; });
    return It == Options.end() ? nullptr : &*It;
}

bool ArgParser::Parse(int argc, const char* const argv[])
{
    Settings.clear();
    Positionals.clear();
    Errors.clear();

    bool OptionsEnded = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string Arg = argv[i];

        if (OptionsEnded || Arg.size() < 2 || Arg[0] != '-')
        {
            Positionals.push_back(Arg);
            continue;
        }
        if (Arg == "--")
        {
            OptionsEnded = true;
            continue;
        }

        const Option* Opt = nullptr;
        std::string InlineValue;
        bool HasInlineValue = false;

        if (Arg[1] == '-')
        {
            std::string Name = Arg.substr(2);
            const size_t EqualPos = Name.find('=');
            if (EqualPos != std::string::npos)
            {
                InlineValue = Name.substr(EqualPos + 1);
                HasInlineValue = true;
                Name = Name.substr(0, EqualPos);
            }
            Opt = FindLong(Name);
        }
        else if (Arg.size() == 2)
        {
            Opt = FindShort(Arg[1]);
        }

        if (Opt == nullptr)
        {
            Errors.push_back("Unknown option: " + Arg);
            continue;
        }

        if (!Opt->RequiresValue)
        {
            if (HasInlineValue)
            {
                Errors.push_back("Option " + Arg + " does not take a value");
                continue;
            }
            Settings.emplace_back(Opt->Key, Opt->FlagValue);
            continue;
        }

        if (HasInlineValue)
        {
            Settings.emplace_back(Opt->Key, InlineValue);
        }
        else if (i + 1 < argc)
        {
            Settings.emplace_back(Opt->Key, argv[++i]);
        }
        else
        {
            Errors.push_back("Option " + Arg + " requires a value");
        }
    }

    return Errors.empty();
}

const std::vector<std::pair<std::string, std::string>>& ArgParser::GetSettings() const
{
    return Settings;
}

const std::vector<std::string>& ArgParser::GetPositionals() const
{
    return Positionals;
}

const std::vector<std::string>& ArgParser::GetErrors() const
{
    return Errors;
}

bool ArgParser::HasSetting(const std::string& Key) const
{
    return std::any_of(Settings.begin(), Settings.end(), [&Key](const auto& Setting) { return Setting.first == Key; });
}

std::string ArgParser::GetSetting(const std::string& Key) const
{
    // Last occurrence wins.
    for (auto It = Settings.rbegin(); It != Settings.rend(); ++It)
    {
        if (It->first == Key)
        {
            return It->second;
        }
    }
    return std::string();
}

std::string ArgParser::Usage(const std::string& Program) const
{
    std::ostringstream Out;
    Out << "Usage: " << Program << " <directory> [options]\n\nOptions:\n";
    for (const Option& Opt : Options)
    {
        std::string Flags = "  ";
        if (Opt.ShortName != '\0')
        {
            Flags += std::string("-") + Opt.ShortName + ", ";
        }
        else
        {
            Flags += "    ";
        }
        Flags += "--" + Opt.LongName;
        if (Opt.RequiresValue)
        {
            Flags += " " + (Opt.ValueName.empty() ? std::string("VALUE") : Opt.ValueName);
        }
        if (Flags.size() < 32)
        {
            Flags.resize(32, ' ');
        }
        else
        {
            Flags += "  ";
        }
        Out << Flags << Opt.Description << "\n";
    }
    return Out.str();
}
