#include "crypto/typeddata.h"
#include "crypto/hash.h"

#include <iterator>
#include <sstream>

#include <boost/algorithm/hex.hpp>

// ================================================================

Hash256
VoteData::GetStructHash() const
{
    static const Hash256 typeHash = Hash(std::string(VOTE_TYPE_STRING));

    // field order must match VOTE_TYPE_STRING
    HashWriter writer;
    writer.writeWord(typeHash)
          .writeWord(this->voter)
          .writeWord(this->electionId)
          .writeWord(this->candidateId)
          .writeWord(this->nonce)
          .writeWord(static_cast<uint64_t>(this->deadline));
    return writer.GetHash();
}

// ----------------------------------------------------------------

std::string
VoteData::toString() const
{
    std::stringstream ss;
    ss << "VoteData {voter=" << voter.ToString()
       << ", election=" << electionId
       << ", candidate=" << candidateId
       << ", nonce=" << nonce
       << ", deadline=" << deadline << "}";
    return ss.str();
}

// ================================================================

Hash256
SigningDomain::GetSeparator() const
{
    static const Hash256 typeHash = Hash(std::string(DOMAIN_TYPE_STRING));

    HashWriter writer;
    writer.writeWord(typeHash)
          .writeWord(Hash(this->name))
          .writeWord(Hash(this->version))
          .writeWord(this->chainId)
          .writeWord(this->verifyingContract);
    return writer.GetHash();
}

// ----------------------------------------------------------------

Hash256
SigningDomain::GetDigest(const Hash256& structHash) const
{
    static const unsigned char prefix[2] = {0x19, 0x01};

    HashWriter writer;
    writer.write(prefix, sizeof(prefix))
          .writeWord(this->GetSeparator())
          .writeWord(structHash);
    return writer.GetHash();
}

// ----------------------------------------------------------------

bool
SigningDomain::Sign(const CKey& key, const VoteData& data, std::vector<unsigned char>& sigOut) const
{
    return key.SignCompact(this->GetDigest(data.GetStructHash()), sigOut);
}

// ----------------------------------------------------------------

bool
SigningDomain::RecoverSigner(const VoteData& data, const std::vector<unsigned char>& sig, Address& signerOut) const
{
    CPubKey recovered;
    if (!recovered.RecoverCompact(this->GetDigest(data.GetStructHash()), sig))
        return false;

    signerOut = recovered.GetAddress();
    return true;
}

// ================================================================

std::string
EncodeHex(const std::vector<unsigned char>& data)
{
    std::string result;
    boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(result));
    return result;
}

// ----------------------------------------------------------------

bool
DecodeHex(const std::string& str, std::vector<unsigned char>& out)
{
    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex = hex.substr(2);

    std::vector<unsigned char> result;
    try
    {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(result));
    }
    catch (const boost::algorithm::hex_decode_error&)
    {
        return false;
    }

    out.swap(result);
    return true;
}
