/*=============================================================================

The ballot store. Records at most one vote per voter and election, keeps the
tally of every candidate and accepts votes relayed on behalf of a voter,
authenticated by a typed-data signature over the vote payload and a strictly
sequential per voter nonce.

Elections are looked up through the registry (ElectionLookup). The store
holds its lock for the whole validate-then-commit sequence of every
operation; registry reads happen under that lock (lock order: store, then
registry).

The verification hash of a vote is no hiding commitment: given the stored
salt and timestamp anyone can check which candidate a voter picked.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_VOTESTORAGE_H
#define EKURA_VOTESTORAGE_H

#include "capability.h"
#include "clock.h"
#include "election.h"
#include "electionlookup.h"
#include "events.h"
#include "result.h"
#include "crypto/fixedbytes.h"
#include "crypto/typeddata.h"

#include <map>
#include <stdint.h>
#include <utility>
#include <vector>

#include <boost/thread/mutex.hpp>

#include <boost/serialization/access.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/utility.hpp>

class VoteStorage
{
public:
    VoteStorage(const Address& self, uint64_t chainId,
                const Clock& clock, EventLog& eventLog);

    // ----------------------------------------------------------------
    // Setup & owner operations

    // One-time setup, the caller becomes the owner (factory may be NULL)
    ResultCode initialize(const Address& caller, const ElectionLookup* factory);

    ResultCode setElectionFactory(const Address& caller, const ElectionLookup* factory);

    ResultCode pause(const Address& caller);

    ResultCode unpause(const Address& caller);

    ResultCode transferOwnership(const Address& caller, const Address& newOwner);

    // Reconnect the registry after the state was loaded, false if its
    // address differs from the stored one
    bool attachElectionFactory(const ElectionLookup* factory);

    // ----------------------------------------------------------------
    // Voting

    // Cast a vote as the caller
    ResultCode vote(const Address& caller, uint64_t electionId, uint64_t candidateId);

    // Relay a vote signed by voteData.voter, the caller pays as relayer
    ResultCode voteWithSignature(const Address& caller, const VoteData& voteData,
                                 const std::vector<unsigned char>& signature);

    // ----------------------------------------------------------------
    // Reads

    // Null hash if the voter has not voted
    Hash256 getVoteHash(uint64_t electionId, const Address& voter) const;

    int64_t getVoteTimestamp(uint64_t electionId, const Address& voter) const;

    Hash256 getVoteSalt(uint64_t electionId, const Address& voter) const;

    bool hasVoted(uint64_t electionId, const Address& voter) const;

    uint64_t getVoteCount(uint64_t electionId, uint64_t candidateId) const;

    // One count per candidate in candidate order
    ResultCode getAllVoteCounts(uint64_t electionId, std::vector<uint64_t>& countsOut) const;

    // Recompute the verification hash for the claimed candidate
    bool verifyVoteHash(uint64_t electionId, const Address& voter, uint64_t candidateId) const;

    uint64_t getNonce(const Address& voter) const;

    // Null if no registry is set
    Address getElectionFactory() const;

    bool isPaused() const;

    bool isInitialized() const;

    Address getOwner() const;

    Hash256 getDomainSeparator() const;

    // Domain delegated votes have to be signed for
    SigningDomain getSigningDomain() const;

    Address getAddress() const;

    uint64_t getChainId() const;

private:
    typedef std::pair<uint64_t, Address> VoteKey;
    typedef std::pair<uint64_t, uint64_t> TallyKey;

    Address self;

    uint64_t chainId;

    const Clock& clock;

    EventLog& eventLog;

    mutable boost::mutex mutex;

    StoreOwnerCapability owner;

    bool initialized = false;

    bool paused = false;

    // Registry reference (not owned)
    const ElectionLookup* factory = NULL;

    // Address of the registry, kept to reattach after loading
    Address factoryAddress;

    std::map<VoteKey, VoteRecord> votes;

    std::map<TallyKey, uint64_t> tallies;

    std::map<Address, uint64_t> nonces;

    // Checks shared by direct and relayed votes, requires the lock
    ResultCode checkVote(const Address& voter, uint64_t electionId, uint64_t candidateId) const;

    // Record and tally a validated vote, requires the lock
    void recordVote(const Address& voter, uint64_t electionId, uint64_t candidateId, bool isDelegated);

    static Hash256 computeVoteHash(const Address& voter, uint64_t electionId, uint64_t candidateId,
                                   int64_t timestamp, const Hash256& salt);

    static Hash256 computeSalt(const Address& voter, uint64_t electionId, uint64_t candidateId,
                               int64_t timestamp);

    VoteStorage(const VoteStorage&);
    void operator=(const VoteStorage&);

    // ----------------------------------------------------------------

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        boost::mutex::scoped_lock lock(this->mutex);

        // DO NOT SERIALIZE THE REGISTRY, IT HAS TO BE REATTACHED
        a & this->self;
        a & this->chainId;
        a & this->owner;
        a & this->initialized;
        a & this->paused;
        a & this->factoryAddress;
        a & this->votes;
        a & this->tallies;
        a & this->nonces;
    }
};

#endif // EKURA_VOTESTORAGE_H
