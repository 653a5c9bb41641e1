/*=============================================================================

Records of the election platform: elections with all their attributes,
organizations with their admin sets and election lists, and the per voter
vote records of the ballot store.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_ELECTION_H
#define EKURA_ELECTION_H

#include "crypto/fixedbytes.h"

#include <set>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/serialization/access.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/set.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

// ----------------------------------------------------------------
// Candidate labels, indexed from 0
typedef std::vector<std::string> Candidates;

// ----------------------------------------------------------------
class Election
{
public:

    // Organization the election belongs to
    uint64_t orgId = 0;

    // Sequential identifier (starting at 1, 0 means "not found")
    uint64_t id = 0;

    std::string name;

    std::string description;

    // Voting window (UNIX time, sec, both inclusive)
    int64_t startTime = 0;
    int64_t endTime = 0;

    // Toggled by the platform admin
    bool isActive = false;

    // Fixed at creation
    Candidates candidates;

    // Org admin who created the election
    Address creator;

    int64_t createdAt = 0;

    // ----------------------------------------------------------------

    // Active flag set and now within [startTime, endTime]
    bool isOpenAt(int64_t now) const
    {
        return this->isActive && this->startTime <= now && now <= this->endTime;
    }

    inline bool operator==(const Election& other) const
    {
        return this->orgId == other.orgId && this->id == other.id &&
                this->name == other.name && this->description == other.description &&
                this->startTime == other.startTime && this->endTime == other.endTime &&
                this->isActive == other.isActive && this->candidates == other.candidates &&
                this->creator == other.creator && this->createdAt == other.createdAt;
    }

private:

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->orgId;
        a & this->id;
        a & this->name;
        a & this->description;
        a & this->startTime;
        a & this->endTime;
        a & this->isActive;
        a & this->candidates;
        a & this->creator;
        a & this->createdAt;
    }
};

// ----------------------------------------------------------------
// Created implicitly on the first admin grant or election, never deleted
class Organization
{
public:

    uint64_t id = 0;

    std::set<Address> admins;

    // In creation order
    std::vector<uint64_t> electionIds;

    // ----------------------------------------------------------------

    bool isAdmin(const Address& address) const
    {
        return this->admins.count(address) > 0;
    }

    inline bool operator==(const Organization& other) const
    {
        return this->id == other.id && this->admins == other.admins &&
                this->electionIds == other.electionIds;
    }

private:

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->id;
        a & this->admins;
        a & this->electionIds;
    }
};

// ----------------------------------------------------------------
// Everything the ballot store needs to validate a vote, taken at one instant
typedef struct ElectionSnapshot_t
{
    uint64_t electionId = 0;

    bool isActive = false;

    uint64_t candidateCount = 0;
} ElectionSnapshot;

// ----------------------------------------------------------------
typedef struct VoteRecord_t
{
    bool hasVoted = false;

    // Verification hash over voter, candidate, election, timestamp and salt
    Hash256 voteHash;

    Hash256 salt;

    int64_t timestamp = 0;

    // ----------------------------------------------------------------

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->hasVoted;
        a & this->voteHash;
        a & this->salt;
        a & this->timestamp;
    }
} VoteRecord;

#endif // EKURA_ELECTION_H
