#include "crypto/hash.h"

#include <cstring>
#include <stdexcept>

// ================================================================

namespace {

void DigestOrThrow(const EVP_MD* md, const unsigned char* pbegin, size_t len,
                   unsigned char* out, unsigned int expected)
{
    unsigned int outLen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();

    bool ok = ctx != NULL &&
              EVP_DigestInit_ex(ctx, md, NULL) == 1 &&
              EVP_DigestUpdate(ctx, pbegin, len) == 1 &&
              EVP_DigestFinal_ex(ctx, out, &outLen) == 1;

    EVP_MD_CTX_free(ctx);

    if (!ok || outLen != expected)
        throw std::runtime_error("Critical error during hash creation");
}

} // end of anonymous namespace

// ================================================================

Hash256
Hash(const unsigned char* pbegin, const unsigned char* pend)
{
    Hash256 result;
    DigestOrThrow(EVP_sha3_256(), pbegin, pend - pbegin, result.begin(), 32);
    return result;
}

// ----------------------------------------------------------------

Hash256
Hash(const std::string& str)
{
    const unsigned char* p = reinterpret_cast<const unsigned char*>(str.data());
    return Hash(p, p + str.size());
}

// ----------------------------------------------------------------

Address
Hash160(const unsigned char* pbegin, const unsigned char* pend)
{
    unsigned char sha[32];
    DigestOrThrow(EVP_sha256(), pbegin, pend - pbegin, sha, 32);

    Address result;
    DigestOrThrow(EVP_ripemd160(), sha, sizeof(sha), result.begin(), 20);
    return result;
}

// ================================================================

HashWriter::HashWriter():
    ctx(EVP_MD_CTX_new()),
    finalized(false)
{
    if (ctx == NULL || EVP_DigestInit_ex(ctx, EVP_sha3_256(), NULL) != 1)
    {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Critical error during hash creation");
    }
}

HashWriter::~HashWriter()
{
    EVP_MD_CTX_free(ctx);
}

// ----------------------------------------------------------------

HashWriter&
HashWriter::write(const unsigned char* pbegin, size_t len)
{
    if (finalized)
        throw std::logic_error("HashWriter already finalized");

    if (EVP_DigestUpdate(ctx, pbegin, len) != 1)
        throw std::runtime_error("Critical error during hash creation");

    return *this;
}

// ----------------------------------------------------------------

HashWriter&
HashWriter::writeWord(uint64_t value)
{
    unsigned char word[32];
    memset(word, 0, sizeof(word));

    // big-endian into the last 8 bytes
    for (int i = 0; i < 8; i++)
        word[31 - i] = static_cast<unsigned char>(value >> (8 * i));

    return write(word, sizeof(word));
}

HashWriter&
HashWriter::writeWord(const Address& address)
{
    unsigned char word[32];
    memset(word, 0, sizeof(word));
    memcpy(word + 12, address.begin(), 20);

    return write(word, sizeof(word));
}

HashWriter&
HashWriter::writeWord(const Hash256& hash)
{
    return write(hash.begin(), 32);
}

HashWriter&
HashWriter::writePacked(const Address& address)
{
    return write(address.begin(), 20);
}

// ----------------------------------------------------------------

Hash256
HashWriter::GetHash()
{
    if (finalized)
        throw std::logic_error("HashWriter already finalized");

    Hash256 result;
    unsigned int outLen = 0;
    finalized = true;

    if (EVP_DigestFinal_ex(ctx, result.begin(), &outLen) != 1 || outLen != 32)
        throw std::runtime_error("Critical error during hash creation");

    return result;
}
