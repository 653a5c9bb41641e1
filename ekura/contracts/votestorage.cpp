#include "contracts/votestorage.h"

#include "helper.h"
#include "crypto/hash.h"

#include <boost/make_shared.hpp>

// ================================================================

static ResultCode
reject(const char* operation, const Address& caller, ResultCode result)
{
    Log::w("(VoteStorage) %s by %s rejected: %s", operation,
           caller.ToString().c_str(), resultName(result).c_str());
    return result;
}

// ================================================================

VoteStorage::VoteStorage(const Address& self, uint64_t chainId,
                         const Clock& clock, EventLog& eventLog):
    self(self),
    chainId(chainId),
    clock(clock),
    eventLog(eventLog)
{
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::initialize(const Address& caller, const ElectionLookup* factory)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (this->initialized)
        return reject("initialize", caller, RC_ALREADY_INITIALIZED);

    if (caller.IsNull())
        return reject("initialize", caller, RC_INVALID_OWNER_ADDRESS);

    Address address;
    if (factory)
    {
        address = factory->getAddress();
        if (address.IsNull())
            return reject("initialize", caller, RC_INVALID_FACTORY_ADDRESS);
    }

    // commit
    this->initialized = true;
    this->factory = factory;
    this->factoryAddress = address;
    Address previous = this->owner.transferTo(caller);

    Log::i("(VoteStorage) Initialized by %s with registry %s",
           caller.ToString().c_str(), address.ToString().c_str());

    boost::shared_ptr<InitializedEvent> event = boost::make_shared<InitializedEvent>();
    event->owner = caller;
    event->factory = address;
    this->eventLog.emit(event);

    boost::shared_ptr<OwnershipTransferredEvent> transfer = boost::make_shared<OwnershipTransferredEvent>();
    transfer->previousOwner = previous;
    transfer->newOwner = caller;
    this->eventLog.emit(transfer);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::setElectionFactory(const Address& caller, const ElectionLookup* factory)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->owner.isHeldBy(caller))
        return reject("setElectionFactory", caller, RC_NOT_OWNER);

    if (!factory || factory->getAddress().IsNull())
        return reject("setElectionFactory", caller, RC_INVALID_FACTORY_ADDRESS);

    // commit
    Address oldAddress = this->factoryAddress;
    this->factory = factory;
    this->factoryAddress = factory->getAddress();

    Log::i("(VoteStorage) Registry changed from %s to %s",
           oldAddress.ToString().c_str(), this->factoryAddress.ToString().c_str());

    boost::shared_ptr<ElectionFactoryUpdatedEvent> event = boost::make_shared<ElectionFactoryUpdatedEvent>();
    event->oldAddress = oldAddress;
    event->newAddress = this->factoryAddress;
    event->changedBy = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::pause(const Address& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->owner.isHeldBy(caller))
        return reject("pause", caller, RC_NOT_OWNER);

    if (this->paused)
        return reject("pause", caller, RC_PAUSED);

    this->paused = true;

    Log::i("(VoteStorage) Paused by %s", caller.ToString().c_str());

    boost::shared_ptr<PauseEvent> event = boost::make_shared<PauseEvent>(EV_PAUSED);
    event->account = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::unpause(const Address& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->owner.isHeldBy(caller))
        return reject("unpause", caller, RC_NOT_OWNER);

    if (!this->paused)
        return reject("unpause", caller, RC_NOT_PAUSED);

    this->paused = false;

    Log::i("(VoteStorage) Unpaused by %s", caller.ToString().c_str());

    boost::shared_ptr<PauseEvent> event = boost::make_shared<PauseEvent>(EV_UNPAUSED);
    event->account = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::transferOwnership(const Address& caller, const Address& newOwner)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->owner.isHeldBy(caller))
        return reject("transferOwnership", caller, RC_NOT_OWNER);

    if (newOwner.IsNull())
        return reject("transferOwnership", caller, RC_INVALID_OWNER_ADDRESS);

    Address previous = this->owner.transferTo(newOwner);

    Log::i("(VoteStorage) Ownership transferred from %s to %s",
           previous.ToString().c_str(), newOwner.ToString().c_str());

    boost::shared_ptr<OwnershipTransferredEvent> event = boost::make_shared<OwnershipTransferredEvent>();
    event->previousOwner = previous;
    event->newOwner = newOwner;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

bool
VoteStorage::attachElectionFactory(const ElectionLookup* factory)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!factory || factory->getAddress() != this->factoryAddress)
        return false;

    this->factory = factory;
    return true;
}

// ================================================================

ResultCode
VoteStorage::vote(const Address& caller, uint64_t electionId, uint64_t candidateId)
{
    boost::mutex::scoped_lock lock(this->mutex);

    ResultCode result = this->checkVote(caller, electionId, candidateId);
    if (result != RC_OK)
        return reject("vote", caller, result);

    this->recordVote(caller, electionId, candidateId, false);
    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::voteWithSignature(const Address& caller, const VoteData& voteData,
                               const std::vector<unsigned char>& signature)
{
    boost::mutex::scoped_lock lock(this->mutex);

    ResultCode result = this->checkVote(voteData.voter, voteData.electionId, voteData.candidateId);
    if (result != RC_OK)
        return reject("voteWithSignature", caller, result);

    if (this->clock.now() > voteData.deadline)
        return reject("voteWithSignature", caller, RC_SIGNATURE_EXPIRED);

    uint64_t currentNonce = 0;
    std::map<Address, uint64_t>::const_iterator it = this->nonces.find(voteData.voter);
    if (it != this->nonces.end())
        currentNonce = it->second;

    if (voteData.nonce != currentNonce)
        return reject("voteWithSignature", caller, RC_INVALID_NONCE);

    // the signer has to be exactly the voter named in the payload
    Address signer;
    if (!this->getSigningDomain().RecoverSigner(voteData, signature, signer) || signer != voteData.voter)
        return reject("voteWithSignature", caller, RC_INVALID_SIGNATURE);

    // commit, nonce first
    this->nonces[voteData.voter] = currentNonce + 1;

    Log::i("(VoteStorage) Relaying vote of %s by %s (nonce %llu)",
           voteData.voter.ToString().c_str(), caller.ToString().c_str(),
           (unsigned long long) currentNonce);

    boost::shared_ptr<MetaTransactionExecutedEvent> event = boost::make_shared<MetaTransactionExecutedEvent>();
    event->voter = voteData.voter;
    event->relayer = caller;
    event->electionId = voteData.electionId;
    event->nonce = currentNonce;
    this->eventLog.emit(event);

    this->recordVote(voteData.voter, voteData.electionId, voteData.candidateId, true);
    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::checkVote(const Address& voter, uint64_t electionId, uint64_t candidateId) const
{
    if (this->paused)
        return RC_PAUSED;

    if (!this->factory)
        return RC_FACTORY_NOT_SET;

    ElectionSnapshot snapshot;
    ResultCode result = this->factory->getVotingSnapshot(electionId, snapshot);
    if (result != RC_OK)
        return result;

    if (!snapshot.isActive)
        return RC_ELECTION_NOT_ACTIVE;

    if (this->votes.count(VoteKey(electionId, voter)) > 0)
        return RC_ALREADY_VOTED;

    if (candidateId >= snapshot.candidateCount)
        return RC_INVALID_CANDIDATE;

    return RC_OK;
}

// ----------------------------------------------------------------

void
VoteStorage::recordVote(const Address& voter, uint64_t electionId, uint64_t candidateId, bool isDelegated)
{
    int64_t now = this->clock.now();

    VoteRecord record;
    record.hasVoted = true;
    record.timestamp = now;
    record.salt = computeSalt(voter, electionId, candidateId, now);
    record.voteHash = computeVoteHash(voter, electionId, candidateId, now, record.salt);

    this->votes[VoteKey(electionId, voter)] = record;
    uint64_t newCount = ++this->tallies[TallyKey(electionId, candidateId)];

    Log::i("(VoteStorage) Vote of %s recorded for election %llu%s",
           voter.ToString().c_str(), (unsigned long long) electionId,
           isDelegated ? " (delegated)" : "");

    boost::shared_ptr<VoteCastEvent> cast = boost::make_shared<VoteCastEvent>();
    cast->voter = voter;
    cast->electionId = electionId;
    cast->candidateId = candidateId;
    cast->voteHash = record.voteHash;
    cast->timestamp = now;
    cast->isDelegated = isDelegated;
    this->eventLog.emit(cast);

    boost::shared_ptr<VoteCountUpdatedEvent> count = boost::make_shared<VoteCountUpdatedEvent>();
    count->electionId = electionId;
    count->candidateId = candidateId;
    count->newCount = newCount;
    this->eventLog.emit(count);
}

// ----------------------------------------------------------------

Hash256
VoteStorage::computeVoteHash(const Address& voter, uint64_t electionId, uint64_t candidateId,
                             int64_t timestamp, const Hash256& salt)
{
    HashWriter writer;
    writer.writePacked(voter)
          .writeWord(candidateId)
          .writeWord(electionId)
          .writeWord(static_cast<uint64_t>(timestamp))
          .writeWord(salt);
    return writer.GetHash();
}

// ----------------------------------------------------------------

Hash256
VoteStorage::computeSalt(const Address& voter, uint64_t electionId, uint64_t candidateId,
                         int64_t timestamp)
{
    Hash256 entropy = Helper::GenerateRandom256();

    HashWriter writer;
    writer.writePacked(voter)
          .writeWord(electionId)
          .writeWord(candidateId)
          .writeWord(static_cast<uint64_t>(timestamp))
          .writeWord(entropy);
    return writer.GetHash();
}

// ================================================================

Hash256
VoteStorage::getVoteHash(uint64_t electionId, const Address& voter) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<VoteKey, VoteRecord>::const_iterator it = this->votes.find(VoteKey(electionId, voter));
    if (it == this->votes.end())
        return Hash256();

    return it->second.voteHash;
}

// ----------------------------------------------------------------

int64_t
VoteStorage::getVoteTimestamp(uint64_t electionId, const Address& voter) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<VoteKey, VoteRecord>::const_iterator it = this->votes.find(VoteKey(electionId, voter));
    if (it == this->votes.end())
        return 0;

    return it->second.timestamp;
}

// ----------------------------------------------------------------

Hash256
VoteStorage::getVoteSalt(uint64_t electionId, const Address& voter) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<VoteKey, VoteRecord>::const_iterator it = this->votes.find(VoteKey(electionId, voter));
    if (it == this->votes.end())
        return Hash256();

    return it->second.salt;
}

// ----------------------------------------------------------------

bool
VoteStorage::hasVoted(uint64_t electionId, const Address& voter) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<VoteKey, VoteRecord>::const_iterator it = this->votes.find(VoteKey(electionId, voter));
    return it != this->votes.end() && it->second.hasVoted;
}

// ----------------------------------------------------------------

uint64_t
VoteStorage::getVoteCount(uint64_t electionId, uint64_t candidateId) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<TallyKey, uint64_t>::const_iterator it = this->tallies.find(TallyKey(electionId, candidateId));
    if (it == this->tallies.end())
        return 0;

    return it->second;
}

// ----------------------------------------------------------------

ResultCode
VoteStorage::getAllVoteCounts(uint64_t electionId, std::vector<uint64_t>& countsOut) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->factory)
        return RC_FACTORY_NOT_SET;

    ElectionSnapshot snapshot;
    ResultCode result = this->factory->getVotingSnapshot(electionId, snapshot);
    if (result != RC_OK)
        return result;

    std::vector<uint64_t> counts(snapshot.candidateCount, 0);
    for (uint64_t i = 0; i < snapshot.candidateCount; i++)
    {
        std::map<TallyKey, uint64_t>::const_iterator it = this->tallies.find(TallyKey(electionId, i));
        if (it != this->tallies.end())
            counts[i] = it->second;
    }

    countsOut.swap(counts);
    return RC_OK;
}

// ----------------------------------------------------------------

bool
VoteStorage::verifyVoteHash(uint64_t electionId, const Address& voter, uint64_t candidateId) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<VoteKey, VoteRecord>::const_iterator it = this->votes.find(VoteKey(electionId, voter));
    if (it == this->votes.end() || !it->second.hasVoted)
        return false;

    const VoteRecord& record = it->second;
    return computeVoteHash(voter, electionId, candidateId, record.timestamp, record.salt) == record.voteHash;
}

// ----------------------------------------------------------------

uint64_t
VoteStorage::getNonce(const Address& voter) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<Address, uint64_t>::const_iterator it = this->nonces.find(voter);
    if (it == this->nonces.end())
        return 0;

    return it->second;
}

// ----------------------------------------------------------------

Address
VoteStorage::getElectionFactory() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->factoryAddress;
}

// ----------------------------------------------------------------

bool
VoteStorage::isPaused() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->paused;
}

// ----------------------------------------------------------------

bool
VoteStorage::isInitialized() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->initialized;
}

// ----------------------------------------------------------------

Address
VoteStorage::getOwner() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->owner.getHolder();
}

// ----------------------------------------------------------------

Hash256
VoteStorage::getDomainSeparator() const
{
    return this->getSigningDomain().GetSeparator();
}

// ----------------------------------------------------------------

SigningDomain
VoteStorage::getSigningDomain() const
{
    return SigningDomain(this->chainId, this->self);
}

// ----------------------------------------------------------------

Address
VoteStorage::getAddress() const
{
    return this->self;
}

// ----------------------------------------------------------------

uint64_t
VoteStorage::getChainId() const
{
    return this->chainId;
}
