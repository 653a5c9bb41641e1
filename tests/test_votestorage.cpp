#include "tests/test_votestorage.h"
#include "tests/test_helpers.h"

#include "helper.h"

#include <boost/pointer_cast.hpp>

#include <cassert>
#include <stdexcept>

// ----------------------------------------------------------------------------

void test_votestorage_initialize()
{
    Log::i("(Test) - Initialization and ownership");

    ManualClock clock;
    EventLog events;
    Address owner = testAddress(0xA3);
    Address stranger = testAddress(0xC1);
    FakeElectionLookup registry(testAddress(0xF1), clock);

    VoteStorage storage(testAddress(0xF2), TEST_CHAIN_ID, clock, events);
    assert(!storage.isInitialized());
    assert(storage.getOwner().IsNull());
    assert(storage.getElectionFactory().IsNull());

    // nobody owns an uninitialized store
    assert(storage.pause(owner) == RC_NOT_OWNER);
    assert(storage.vote(owner, 1, 0) == RC_FACTORY_NOT_SET);

    assert(storage.initialize(Address(), &registry) == RC_INVALID_OWNER_ADDRESS);
    assert(storage.initialize(owner, &registry) == RC_OK);
    assert(storage.isInitialized());
    assert(storage.getOwner() == owner);
    assert(storage.getElectionFactory() == registry.getAddress());

    // one time only
    assert(storage.initialize(stranger, NULL) == RC_ALREADY_INITIALIZED);
    assert(storage.getOwner() == owner);

    std::vector<EventPtr> all = events.getAll();
    assert(all.size() == 2);
    assert(all[0]->getType() == EV_INITIALIZED);
    assert(all[1]->getType() == EV_OWNERSHIP_TRANSFERRED);
    boost::shared_ptr<OwnershipTransferredEvent> initial = boost::dynamic_pointer_cast<OwnershipTransferredEvent>(all[1]);
    assert(initial && initial->previousOwner.IsNull() && initial->newOwner == owner);

    // transfer
    assert(storage.transferOwnership(stranger, stranger) == RC_NOT_OWNER);
    assert(storage.transferOwnership(owner, Address()) == RC_INVALID_OWNER_ADDRESS);
    assert(storage.transferOwnership(owner, stranger) == RC_OK);
    assert(storage.getOwner() == stranger);
    assert(storage.pause(owner) == RC_NOT_OWNER);
    assert(storage.pause(stranger) == RC_OK);

    std::vector<EventPtr> transfers = events.getByType(EV_OWNERSHIP_TRANSFERRED);
    assert(transfers.size() == 2);
    boost::shared_ptr<OwnershipTransferredEvent> transfer = boost::dynamic_pointer_cast<OwnershipTransferredEvent>(transfers[1]);
    assert(transfer && transfer->previousOwner == owner && transfer->newOwner == stranger);
}

// ----------------------------------------------------------------------------

void test_votestorage_without_factory()
{
    Log::i("(Test) - Missing registry");

    ManualClock clock;
    EventLog events;
    Address owner = testAddress(0xA3);
    FakeElectionLookup registry(testAddress(0xF1), clock);
    FakeElectionLookup nullRegistry(Address(), clock);

    Election election;
    election.id = 1;
    election.isActive = true;
    election.startTime = TEST_T0 - 10;
    election.endTime = TEST_T0 + 10;
    election.candidates = threeCandidates();
    registry.put(election);

    VoteStorage storage(testAddress(0xF2), TEST_CHAIN_ID, clock, events);
    assert(storage.initialize(owner, &nullRegistry) == RC_INVALID_FACTORY_ADDRESS);
    assert(!storage.isInitialized());

    assert(storage.initialize(owner, NULL) == RC_OK);
    assert(storage.getElectionFactory().IsNull());

    std::vector<uint64_t> counts;
    assert(storage.vote(testAddress(0x01), 1, 0) == RC_FACTORY_NOT_SET);
    assert(storage.getAllVoteCounts(1, counts) == RC_FACTORY_NOT_SET);

    // setting the registry
    assert(storage.setElectionFactory(testAddress(0x01), &registry) == RC_NOT_OWNER);
    assert(storage.setElectionFactory(owner, NULL) == RC_INVALID_FACTORY_ADDRESS);
    assert(storage.setElectionFactory(owner, &nullRegistry) == RC_INVALID_FACTORY_ADDRESS);
    assert(storage.setElectionFactory(owner, &registry) == RC_OK);
    assert(storage.getElectionFactory() == registry.getAddress());

    std::vector<EventPtr> updates = events.getByType(EV_ELECTION_FACTORY_UPDATED);
    assert(updates.size() == 1);
    boost::shared_ptr<ElectionFactoryUpdatedEvent> update = boost::dynamic_pointer_cast<ElectionFactoryUpdatedEvent>(updates[0]);
    assert(update && update->oldAddress.IsNull() && update->newAddress == registry.getAddress());
    assert(update->changedBy == owner);

    // voting works against the fake registry
    assert(storage.vote(testAddress(0x01), 1, 2) == RC_OK);
    assert(storage.getAllVoteCounts(1, counts) == RC_OK);
    assert(counts.size() == 3 && counts[0] == 0 && counts[1] == 0 && counts[2] == 1);
    assert(storage.vote(testAddress(0x02), 2, 0) == RC_ELECTION_NOT_FOUND);
    assert(storage.getAllVoteCounts(2, counts) == RC_ELECTION_NOT_FOUND);
}

// ----------------------------------------------------------------------------

void test_votestorage_scenario()
{
    Log::i("(Test) - Three voters, three candidates");

    TestPlatform p;
    uint64_t id = p.createElection();

    Address voter1 = testAddress(0x01);
    Address voter2 = testAddress(0x02);
    Address voter3 = testAddress(0x03);

    // before the window
    assert(p.storage.vote(voter1, id, 0) == RC_ELECTION_NOT_ACTIVE);
    assert(!p.storage.hasVoted(id, voter1));

    p.openPolls();
    assert(p.storage.vote(voter1, id, 0) == RC_OK);
    assert(p.storage.vote(voter2, id, 1) == RC_OK);
    assert(p.storage.vote(voter3, id, 0) == RC_OK);

    std::vector<uint64_t> counts;
    assert(p.storage.getAllVoteCounts(id, counts) == RC_OK);
    assert(counts.size() == 3 && counts[0] == 2 && counts[1] == 1 && counts[2] == 0);
    assert(p.storage.getVoteCount(id, 0) == 2);
    assert(p.storage.getVoteCount(id, 2) == 0);
    assert(p.storage.getVoteCount(id, 17) == 0);

    assert(p.storage.hasVoted(id, voter1));
    assert(p.storage.hasVoted(id, voter2));
    assert(p.storage.hasVoted(id, voter3));
    assert(!p.storage.hasVoted(id, testAddress(0x04)));

    // every vote emits VoteCast followed by VoteCountUpdated
    std::vector<EventPtr> all = p.events.getAll();
    std::vector<EventPtr> casts = p.events.getByType(EV_VOTE_CAST);
    std::vector<EventPtr> updates = p.events.getByType(EV_VOTE_COUNT_UPDATED);
    assert(casts.size() == 3 && updates.size() == 3);
    for (size_t i = 0; i < casts.size(); i++)
        assert(updates[i]->getSequence() == casts[i]->getSequence() + 1);

    boost::shared_ptr<VoteCastEvent> cast = boost::dynamic_pointer_cast<VoteCastEvent>(casts[2]);
    assert(cast && cast->voter == voter3 && cast->electionId == id && cast->candidateId == 0);
    assert(!cast->isDelegated);
    assert(cast->timestamp == TEST_T0 + ONE_HOUR + 1);
    assert(cast->voteHash == p.storage.getVoteHash(id, voter3));

    boost::shared_ptr<VoteCountUpdatedEvent> update = boost::dynamic_pointer_cast<VoteCountUpdatedEvent>(updates[2]);
    assert(update && update->candidateId == 0 && update->newCount == 2);
}

// ----------------------------------------------------------------------------

void test_votestorage_rejections()
{
    Log::i("(Test) - Rejected votes");

    TestPlatform p;
    uint64_t id = p.createElection();
    uint64_t second = p.createElection();
    p.openPolls();

    Address voter = testAddress(0x01);

    assert(p.storage.vote(voter, 99, 0) == RC_ELECTION_NOT_FOUND);
    assert(p.storage.vote(voter, id, 3) == RC_INVALID_CANDIDATE);
    assert(!p.storage.hasVoted(id, voter));

    assert(p.storage.vote(voter, id, 2) == RC_OK);
    size_t eventsAfterVote = p.events.size();

    // second vote fails regardless of the candidate, tallies untouched
    assert(p.storage.vote(voter, id, 2) == RC_ALREADY_VOTED);
    assert(p.storage.vote(voter, id, 0) == RC_ALREADY_VOTED);
    assert(p.storage.vote(voter, id, 3) == RC_ALREADY_VOTED);
    assert(p.storage.getVoteCount(id, 2) == 1);
    assert(p.storage.getVoteCount(id, 0) == 0);
    assert(p.events.size() == eventsAfterVote);

    // disabled elections
    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(p.storage.vote(testAddress(0x02), id, 0) == RC_ELECTION_NOT_ACTIVE);
    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(p.storage.vote(testAddress(0x02), id, 0) == RC_OK);

    // window bounds are inclusive
    p.clock.set(TEST_T0 + ONE_HOUR);
    assert(p.storage.vote(testAddress(0x03), second, 0) == RC_OK);
    p.clock.set(TEST_T0 + 7 * ONE_DAY);
    assert(p.storage.vote(testAddress(0x04), second, 0) == RC_OK);
    p.clock.set(TEST_T0 + 7 * ONE_DAY + 1);
    assert(p.storage.vote(testAddress(0x05), second, 0) == RC_ELECTION_NOT_ACTIVE);
    assert(p.storage.getVoteCount(second, 0) == 2);

    // voting in one election does not affect another
    assert(p.storage.hasVoted(id, voter));
    assert(!p.storage.hasVoted(second, voter));
}

// ----------------------------------------------------------------------------

void test_votestorage_verify_hash()
{
    Log::i("(Test) - Vote hash verification");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    Address voter = testAddress(0x01);
    Address other = testAddress(0x02);

    assert(!p.storage.verifyVoteHash(id, voter, 1));
    assert(p.storage.getVoteHash(id, voter).IsNull());
    assert(p.storage.getVoteSalt(id, voter).IsNull());
    assert(p.storage.getVoteTimestamp(id, voter) == 0);

    assert(p.storage.vote(voter, id, 1) == RC_OK);
    assert(p.storage.vote(other, id, 1) == RC_OK);

    assert(p.storage.verifyVoteHash(id, voter, 1));
    assert(!p.storage.verifyVoteHash(id, voter, 0));
    assert(!p.storage.verifyVoteHash(id, voter, 2));
    assert(!p.storage.verifyVoteHash(id + 1, voter, 1));

    assert(!p.storage.getVoteHash(id, voter).IsNull());
    assert(!p.storage.getVoteSalt(id, voter).IsNull());
    assert(p.storage.getVoteTimestamp(id, voter) == TEST_T0 + ONE_HOUR + 1);

    // same candidate at the same time still gives different salts and hashes
    assert(p.storage.getVoteSalt(id, voter) != p.storage.getVoteSalt(id, other));
    assert(p.storage.getVoteHash(id, voter) != p.storage.getVoteHash(id, other));
}

// ----------------------------------------------------------------------------

void test_votestorage_pause()
{
    Log::i("(Test) - Pause and unpause");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    SignKeyPair relayed = newKeyPair();

    assert(p.storage.vote(testAddress(0x01), id, 0) == RC_OK);

    assert(p.storage.unpause(p.owner) == RC_NOT_PAUSED);
    assert(p.storage.pause(p.platformAdmin) == RC_NOT_OWNER);
    assert(p.storage.pause(p.owner) == RC_OK);
    assert(p.storage.isPaused());
    assert(p.storage.pause(p.owner) == RC_PAUSED);

    size_t eventsWhilePaused = p.events.size();

    // every submission fails while paused
    assert(p.storage.vote(testAddress(0x02), id, 1) == RC_PAUSED);
    assert(p.storage.vote(testAddress(0x01), id, 1) == RC_PAUSED);
    VoteData data = p.payload(relayed, id, 1);
    assert(p.storage.voteWithSignature(testAddress(0x09), data, p.sign(relayed, data)) == RC_PAUSED);
    assert(p.storage.getNonce(data.voter) == 0);
    assert(p.events.size() == eventsWhilePaused);

    // reads still work
    assert(p.storage.getVoteCount(id, 0) == 1);
    assert(p.storage.hasVoted(id, testAddress(0x01)));

    assert(p.storage.unpause(p.platformAdmin) == RC_NOT_OWNER);
    assert(p.storage.unpause(p.owner) == RC_OK);
    assert(!p.storage.isPaused());

    // earlier votes are untouched, voting resumes
    assert(p.storage.getVoteCount(id, 0) == 1);
    assert(p.storage.verifyVoteHash(id, testAddress(0x01), 0));
    assert(p.storage.vote(testAddress(0x02), id, 1) == RC_OK);
    assert(p.storage.getVoteCount(id, 1) == 1);

    assert(p.events.getByType(EV_PAUSED).size() == 1);
    assert(p.events.getByType(EV_UNPAUSED).size() == 1);
}

// ----------------------------------------------------------------------------

// Collects the types of all notified events
class EventRecorder
{
public:
    explicit EventRecorder(std::vector<EventType>* types):
        types(types) {}

    void operator()(const EventPtr& event)
    {
        this->types->push_back(event->getType());
    }

private:
    std::vector<EventType>* types;
};

static void failingListener(const EventPtr& event)
{
    throw std::runtime_error("listener failed on " + event->toString());
}

void test_votestorage_subscribers()
{
    Log::i("(Test) - Event subscribers");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    std::vector<EventType> notified;
    p.events.subscribe(EventRecorder(&notified));

    // rejected operations notify nobody
    assert(p.storage.vote(testAddress(0x01), id, 5) == RC_INVALID_CANDIDATE);
    assert(notified.empty());

    assert(p.storage.vote(testAddress(0x01), id, 1) == RC_OK);
    assert(notified.size() == 2);
    assert(notified[0] == EV_VOTE_CAST && notified[1] == EV_VOTE_COUNT_UPDATED);

    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(notified.size() == 3 && notified[2] == EV_ELECTION_STATUS_CHANGED);

    // empty events are refused
    bool thrown = false;
    try
    {
        p.events.emit(EventPtr());
    }
    catch (const std::invalid_argument&)
    {
        thrown = true;
    }
    assert(thrown);
    assert(notified.size() == 3);

    // a throwing listener neither fails the vote nor loses the count update
    p.events.subscribe(&failingListener);
    std::vector<EventType> afterFailure;
    p.events.subscribe(EventRecorder(&afterFailure));

    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(p.storage.vote(testAddress(0x02), id, 2) == RC_OK);
    assert(p.storage.getVoteCount(id, 2) == 1);
    assert(p.events.getByType(EV_VOTE_COUNT_UPDATED).size() == 2);

    assert(afterFailure.size() == 3);
    assert(afterFailure[1] == EV_VOTE_CAST && afterFailure[2] == EV_VOTE_COUNT_UPDATED);
    assert(notified.size() == 6);
}

// ----------------------------------------------------------------------------

void test_votestorage()
{
    Log::i("(Test) # Test: Ballot store");
    test_votestorage_initialize();
    test_votestorage_without_factory();
    test_votestorage_scenario();
    test_votestorage_rejections();
    test_votestorage_verify_hash();
    test_votestorage_pause();
    test_votestorage_subscribers();
}
