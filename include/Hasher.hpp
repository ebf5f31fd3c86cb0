#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

struct evp_md_ctx_st;

enum class HashAlgorithm
{
    Blake2b,
    Blake3
};

bool ParseHashAlgorithm(const std::string& Name, HashAlgorithm& Out);
const char* HashAlgorithmName(HashAlgorithm Algorithm);
std::string ManifestHashColumn(HashAlgorithm Algorithm);

// Streaming digest. Init() may be called again to reuse the instance for another input.
class Hasher
{
public:
    virtual ~Hasher() = default;

    virtual void Init() = 0;
    virtual void Update(const uint8_t* Data, size_t Length) = 0;
    virtual std::vector<uint8_t> Finalize() = 0;

    virtual size_t DigestSize() const = 0;
    virtual const char* Name() const = 0;
};

class Blake2bHasher : public Hasher
{
public:
    Blake2bHasher();
    ~Blake2bHasher() override;

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    void Init() override;
    void Update(const uint8_t* Data, size_t Length) override;
    std::vector<uint8_t> Finalize() override;

    size_t DigestSize() const override;
    const char* Name() const override { return "BLAKE2b-512"; }

private:
    evp_md_ctx_st* Context = nullptr;
};

class Blake3Hasher : public Hasher
{
public:
    Blake3Hasher();
    ~Blake3Hasher() override;

    Blake3Hasher(const Blake3Hasher&) = delete;
    Blake3Hasher& operator=(const Blake3Hasher&) = delete;

    void Init() override;
    void Update(const uint8_t* Data, size_t Length) override;
    std::vector<uint8_t> Finalize() override;

    size_t DigestSize() const override;
    const char* Name() const override { return "BLAKE3"; }

private:
    struct State;
    std::unique_ptr<State> HasherState;
};

std::unique_ptr<Hasher> MakeHasher(HashAlgorithm Algorithm);

std::string ToHex(const std::vector<uint8_t>& Digest);
