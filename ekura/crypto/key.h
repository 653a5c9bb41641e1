/*=============================================================================

secp256k1 keys (OpenSSL). A CKey signs digests producing 65 byte compact
signatures (r || s || v) from which the signer's public key, and therefore
its address, can be recovered. Signatures always carry a low S value.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_KEY_H
#define EKURA_KEY_H

#include "crypto/fixedbytes.h"
#include "crypto/hash.h"

#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>

#include <openssl/crypto.h>

// Size of a compact recoverable signature
#define COMPACT_SIGNATURE_SIZE 65

// ----------------------------------------------------------------
// An encapsulated public key (always stored compressed)
class CPubKey
{
public:

    CPubKey() { Invalidate(); }

    // Construct a public key from a byte vector (33 byte compressed form)
    explicit CPubKey(const std::vector<unsigned char>& vch)
    {
        Set(vch.begin(), vch.end());
    }

    template<typename T>
    void Set(const T pbegin, const T pend)
    {
        if (pend - pbegin == 33 && (pbegin[0] == 2 || pbegin[0] == 3))
            memcpy(vch, &pbegin[0], 33);
        else
            Invalidate();
    }

    unsigned int size() const { return IsValid() ? 33 : 0; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    bool IsValid() const { return vch[0] == 2 || vch[0] == 3; }

    // Fully validate whether this is a point on the curve
    bool IsFullyValid() const;

    // Get the address of this public key
    Address GetAddress() const { return Hash160(begin(), end()); }

    // Recover the public key from a compact signature over the given digest.
    // Rejects signatures with a high S value or a recovery byte other than 27/28.
    bool RecoverCompact(const Hash256& hash, const std::vector<unsigned char>& vchSig);

    // ----------------------------------------------------------------

    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return a.size() == b.size() && memcmp(a.vch, b.vch, a.size()) == 0;
    }

    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }

private:

    friend class boost::serialization::access;

    // The serialized data
    unsigned char vch[33];

    void Invalidate() { vch[0] = 0xFF; }

    template <typename Archive>
    void serialize(Archive& ar, const unsigned int)
    {
        ar & boost::serialization::make_array(vch, 33);
    }
};

// ----------------------------------------------------------------
// An encapsulated private key
class CKey
{
public:

    // Construct an invalid private key
    CKey() : fValid(false) { memset(vch, 0, sizeof(vch)); }

    CKey(const CKey& secret) : fValid(secret.fValid)
    {
        memcpy(vch, secret.vch, sizeof(vch));
    }

    CKey& operator=(const CKey& secret)
    {
        fValid = secret.fValid;
        memcpy(vch, secret.vch, sizeof(vch));
        return *this;
    }

    ~CKey()
    {
        OPENSSL_cleanse(vch, sizeof(vch));
    }

    // Initialize using begin and end iterators to byte data
    template<typename T>
    void Set(const T pbegin, const T pend)
    {
        if (pend - pbegin != 32)
        {
            fValid = false;
            return;
        }

        fValid = Check(&pbegin[0]);
        if (fValid)
            memcpy(vch, &pbegin[0], 32);
    }

    unsigned int size() const { return (fValid ? 32 : 0); }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    bool IsValid() const { return fValid; }

    // Generate a new private key using the OpenSSL CSPRNG
    void MakeNewKey();

    // Compute the public key from a private key
    CPubKey GetPubKey() const;

    // Shortcut for GetPubKey().GetAddress()
    Address GetAddress() const { return GetPubKey().GetAddress(); }

    // Create a 65 byte compact signature (r || s || v, v = 27 + recovery id)
    bool SignCompact(const Hash256& hash, std::vector<unsigned char>& vchSig) const;

    // ----------------------------------------------------------------

    friend bool operator==(const CKey& a, const CKey& b)
    {
        return a.size() == b.size() && memcmp(a.vch, b.vch, a.size()) == 0;
    }

private:

    friend class boost::serialization::access;

    // Whether this private key is valid
    bool fValid;

    // The actual byte data
    unsigned char vch[32];

    // Check whether the 32-byte array is valid keydata (0 < k < n)
    static bool Check(const unsigned char* vch);

    template <typename Archive>
    void serialize(Archive& ar, const unsigned int)
    {
        ar & fValid;
        ar & boost::serialization::make_array(vch, 32);
    }
};

// ----------------------------------------------------------------
// Keypair for signing
typedef std::pair<CKey, CPubKey> SignKeyPair;

// ----------------------------------------------------------------
// Check that required EC support is available at runtime
bool ECC_InitSanityCheck();

#endif // EKURA_KEY_H
