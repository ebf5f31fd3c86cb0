#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <cstdint>

#include <openssl/evp.h>

namespace TestUtils
{
    namespace FS = std::filesystem;

    // Unique scratch directory removed on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<unsigned> Counter{ 0 };
            const auto Stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            Path = FS::temp_directory_path() / ("treehash_test_" + std::to_string(Stamp) + "_" + std::to_string(Counter++));
            FS::create_directories(Path);
        }
        ~TempDir()
        {
            std::error_code Ec;
            FS::permissions(Path, FS::perms::owner_all, FS::perm_options::add, Ec);
            for (auto It = FS::recursive_directory_iterator(Path, FS::directory_options::skip_permission_denied, Ec);
                 It != FS::recursive_directory_iterator(); It.increment(Ec))
            {
                if (!It->is_symlink(Ec))
                {
                    FS::permissions(It->path(), FS::perms::owner_all, FS::perm_options::add, Ec);
                }
            }
            FS::remove_all(Path, Ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const FS::path& Root() const { return Path; }
        std::string String() const { return Path.string(); }

    private:
        FS::path Path;
    };

    inline void WriteFile(const FS::path& Path, const std::string& Content)
    {
        FS::create_directories(Path.parent_path());
        std::ofstream Out(Path, std::ios::binary | std::ios::trunc);
        Out.write(Content.data(), static_cast<std::streamsize>(Content.size()));
    }

    inline std::string Pattern(size_t Size, unsigned Seed)
    {
        std::string Data(Size, '\0');
        uint32_t State = Seed * 2654435761u + 1;
        for (size_t i = 0; i < Size; ++i)
        {
            State = State * 1664525u + 1013904223u;
            Data[i] = static_cast<char>(State >> 24);
        }
        return Data;
    }

    // One-shot digest through a different OpenSSL entry point than the streaming hasher.
    inline std::string ReferenceBlake2b(const std::string& Data)
    {
        unsigned char Digest[EVP_MAX_MD_SIZE];
        unsigned int Length = 0;
        EVP_Digest(Data.data(), Data.size(), Digest, &Length, EVP_blake2b512(), nullptr);
        static const char Digits[] = "0123456789abcdef";
        std::string Hex;
        for (unsigned int i = 0; i < Length; ++i)
        {
            Hex.push_back(Digits[Digest[i] >> 4]);
            Hex.push_back(Digits[Digest[i] & 0x0F]);
        }
        return Hex;
    }

    // True when permission bits are actually enforced for this process (not root).
    inline bool PermissionsEnforced(const FS::path& Unreadable)
    {
        std::ifstream Probe(Unreadable, std::ios::binary);
        return !Probe.is_open();
    }
}
