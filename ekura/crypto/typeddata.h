/*=============================================================================

Typed structured-data signing for delegated votes. A vote payload is hashed
field by field (fixed order and types), bound to a signing domain (scheme
name, version, chain id and the verifying ballot store's address) and the
resulting digest is signed with a compact recoverable signature.

    domainSeparator = H(typeHash(EIP712Domain) || H(name) || H(version) || chainId || verifyingContract)
    structHash      = H(typeHash(Vote) || voter || electionId || candidateId || nonce || deadline)
    digest          = H(0x19 || 0x01 || domainSeparator || structHash)

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_TYPEDDATA_H
#define EKURA_TYPEDDATA_H

#include "crypto/fixedbytes.h"
#include "crypto/key.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <boost/serialization/access.hpp>

#define SIGNING_DOMAIN_NAME    "VoteStorage"
#define SIGNING_DOMAIN_VERSION "1"

#define DOMAIN_TYPE_STRING "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)"
#define VOTE_TYPE_STRING   "Vote(address voter,uint256 electionId,uint256 candidateId,uint256 nonce,uint256 deadline)"

// ----------------------------------------------------------------
// Payload of a delegated (relayed) vote
struct VoteData
{
    // Voter the vote is cast for (must be the signer)
    Address voter;

    uint64_t electionId = 0;

    uint64_t candidateId = 0;

    // Must equal the voter's current nonce at the ballot store
    uint64_t nonce = 0;

    // Last second (UNIX time) the payload may be submitted
    int64_t deadline = 0;

    // ----------------------------------------------------------------

    Hash256 GetStructHash() const;

    std::string toString() const;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & voter;
        a & electionId;
        a & candidateId;
        a & nonce;
        a & deadline;
    }
};

// ----------------------------------------------------------------
class SigningDomain
{
public:

    SigningDomain(uint64_t chainId, const Address& verifyingContract,
                  const std::string& name = SIGNING_DOMAIN_NAME,
                  const std::string& version = SIGNING_DOMAIN_VERSION):
        name(name),
        version(version),
        chainId(chainId),
        verifyingContract(verifyingContract) {}

    // ----------------------------------------------------------------

    Hash256 GetSeparator() const;

    // Digest to be signed for the given struct hash
    Hash256 GetDigest(const Hash256& structHash) const;

    // Sign a vote payload, returns false if the key could not sign
    bool Sign(const CKey& key, const VoteData& data, std::vector<unsigned char>& sigOut) const;

    // Recover the signer of a vote payload, returns false on malformed signatures
    bool RecoverSigner(const VoteData& data, const std::vector<unsigned char>& sig, Address& signerOut) const;

    uint64_t getChainId() const { return chainId; }

    const Address& getVerifyingContract() const { return verifyingContract; }

private:
    std::string name;
    std::string version;
    uint64_t chainId;
    Address verifyingContract;
};

// ----------------------------------------------------------------
// Hex helpers for signatures passed around as text
std::string EncodeHex(const std::vector<unsigned char>& data);
bool DecodeHex(const std::string& str, std::vector<unsigned char>& out);

#endif // EKURA_TYPEDDATA_H
