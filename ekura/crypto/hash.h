/*=============================================================================

Hashing primitives (OpenSSL EVP). SHA3-256 is the platform digest used for
vote hashes, salts and typed structured data; Hash160 derives addresses
from public keys.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_HASH_H
#define EKURA_HASH_H

#include "crypto/fixedbytes.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <openssl/evp.h>

// ----------------------------------------------------------------
// SHA3-256 of a byte range
Hash256 Hash(const unsigned char* pbegin, const unsigned char* pend);

// SHA3-256 of a string (used for type strings and names)
Hash256 Hash(const std::string& str);

// RIPEMD160(SHA256(x))
Address Hash160(const unsigned char* pbegin, const unsigned char* pend);

// ----------------------------------------------------------------
// Incremental SHA3-256 writer.
// write*Word() append 32 byte big-endian words, write*Packed() append the
// tightly packed representation.
class HashWriter
{
public:
    HashWriter();
    ~HashWriter();

    HashWriter& write(const unsigned char* pbegin, size_t len);

    HashWriter& writeWord(uint64_t value);
    HashWriter& writeWord(const Address& address);
    HashWriter& writeWord(const Hash256& hash);

    HashWriter& writePacked(const Address& address);

    // Finalize, the writer can not be used afterwards
    Hash256 GetHash();

private:
    EVP_MD_CTX* ctx;
    bool finalized;

    HashWriter(const HashWriter&);
    void operator=(const HashWriter&);
};

#endif // EKURA_HASH_H
