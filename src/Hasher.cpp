#include "Hasher.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <blake3.h>

#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace
{
    std::runtime_error OpenSSLError(const std::string& What)
    {
        char Buffer[256] = { 0 };
        ERR_error_string_n(ERR_get_error(), Buffer, sizeof(Buffer));
        return std::runtime_error(What + ": " + Buffer);
    }
}

bool ParseHashAlgorithm(const std::string& Name, HashAlgorithm& Out)
{
    std::string Lower = Name;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });

    if (Lower == "blake2b" || Lower == "blake2")
    {
        Out = HashAlgorithm::Blake2b;
        return true;
    }
    if (Lower == "blake3")
    {
        Out = HashAlgorithm::Blake3;
        return true;
    }
    return false;
}

const char* HashAlgorithmName(HashAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case HashAlgorithm::Blake2b: return "blake2b";
    case HashAlgorithm::Blake3:  return "blake3";
    default:                     return "unknown";
    }
}

std::string ManifestHashColumn(HashAlgorithm Algorithm)
{
    return Algorithm == HashAlgorithm::Blake3 ? "BLAKE3 Hash" : "BLAKE2 Hash";
}

Blake2bHasher::Blake2bHasher(): Context(EVP_MD_CTX_new())
{
    if (Context == nullptr)
    {
        throw OpenSSLError("EVP_MD_CTX_new failed");
    }
    Init();
}

Blake2bHasher::~Blake2bHasher()
{
    EVP_MD_CTX_free(Context);
}

void Blake2bHasher::Init()
{
    if (EVP_DigestInit_ex(Context, EVP_blake2b512(), nullptr) != 1)
    {
        throw OpenSSLError("EVP_DigestInit_ex(blake2b512) failed");
    }
}

void Blake2bHasher::Update(const uint8_t* Data, size_t Length)
{
    if (Length == 0)
    {
        return;
    }
    if (EVP_DigestUpdate(Context, Data, Length) != 1)
    {
        throw OpenSSLError("EVP_DigestUpdate failed");
    }
}

std::vector<uint8_t> Blake2bHasher::Finalize()
{
    std::vector<uint8_t> Digest(EVP_MAX_MD_SIZE);
    unsigned int Length = 0;
    if (EVP_DigestFinal_ex(Context, Digest.data(), &Length) != 1)
    {
        throw OpenSSLError("EVP_DigestFinal_ex failed");
    }
    Digest.resize(Length);
    return Digest;
}

size_t Blake2bHasher::DigestSize() const
{
    return static_cast<size_t>(EVP_MD_get_size(EVP_blake2b512()));
}

struct Blake3Hasher::State
{
    blake3_hasher Hasher;
};

Blake3Hasher::Blake3Hasher(): HasherState(std::make_unique<State>())
{
    Init();
}

Blake3Hasher::~Blake3Hasher() = default;

void Blake3Hasher::Init()
{
    blake3_hasher_init(&HasherState->Hasher);
}

void Blake3Hasher::Update(const uint8_t* Data, size_t Length)
{
    blake3_hasher_update(&HasherState->Hasher, Data, Length);
}

std::vector<uint8_t> Blake3Hasher::Finalize()
{
    std::vector<uint8_t> Digest(BLAKE3_OUT_LEN);
    blake3_hasher_finalize(&HasherState->Hasher, Digest.data(), Digest.size());
    return Digest;
}

size_t Blake3Hasher::DigestSize() const
{
    return BLAKE3_OUT_LEN;
}

std::unique_ptr<Hasher> MakeHasher(HashAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case HashAlgorithm::Blake3:
        return std::make_unique<Blake3Hasher>();
    case HashAlgorithm::Blake2b:
    default:
        return std::make_unique<Blake2bHasher>();
    }
}

std::string ToHex(const std::vector<uint8_t>& Digest)
{
    static const char Digits[] = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(Digest.size() * 2);
    for (uint8_t Byte : Digest)
    {
        Hex.push_back(Digits[Byte >> 4]);
        Hex.push_back(Digits[Byte & 0x0F]);
    }
    return Hex;
}
