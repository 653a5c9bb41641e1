#include "tests/test_concurrency.h"
#include "tests/test_helpers.h"

#include "helper.h"

#include <boost/bind/bind.hpp>
#include <boost/thread/thread.hpp>

#include <cassert>

// ----------------------------------------------------------------------------

static void castVote(VoteStorage* storage, const Address& voter, uint64_t electionId,
                     uint64_t candidateId, boost::mutex* mutex, unsigned int* accepted)
{
    if (storage->vote(voter, electionId, candidateId) != RC_OK)
        return;

    boost::mutex::scoped_lock lock(*mutex);
    (*accepted)++;
}

// ----------------------------------------------------------------------------

static void relayVote(VoteStorage* storage, const Address& relayer, const VoteData* data,
                      const std::vector<unsigned char>* signature,
                      boost::mutex* mutex, unsigned int* accepted)
{
    if (storage->voteWithSignature(relayer, *data, *signature) != RC_OK)
        return;

    boost::mutex::scoped_lock lock(*mutex);
    (*accepted)++;
}

// ----------------------------------------------------------------------------

void test_concurrency_same_voter()
{
    Log::i("(Test) - Racing votes of one voter");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    Address voter = testAddress(0x01);
    boost::mutex mutex;
    unsigned int accepted = 0;

    boost::thread_group threads;
    for (unsigned int i = 0; i < 16; i++)
        threads.create_thread(boost::bind(&castVote, &p.storage, voter, id, i % 3, &mutex, &accepted));
    threads.join_all();

    // exactly one of them wins
    assert(accepted == 1);

    std::vector<uint64_t> counts;
    assert(p.storage.getAllVoteCounts(id, counts) == RC_OK);
    assert(counts[0] + counts[1] + counts[2] == 1);
    assert(p.events.getByType(EV_VOTE_CAST).size() == 1);
}

// ----------------------------------------------------------------------------

void test_concurrency_same_nonce()
{
    Log::i("(Test) - Racing relays of one signed payload");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    SignKeyPair voter = newKeyPair();
    VoteData data = p.payload(voter, id, 1);
    std::vector<unsigned char> signature = p.sign(voter, data);

    boost::mutex mutex;
    unsigned int accepted = 0;

    boost::thread_group threads;
    for (unsigned char i = 0; i < 8; i++)
        threads.create_thread(boost::bind(&relayVote, &p.storage, testAddress(0x90 + i),
                                          &data, &signature, &mutex, &accepted));
    threads.join_all();

    assert(accepted == 1);
    assert(p.storage.getNonce(data.voter) == 1);
    assert(p.storage.getVoteCount(id, 1) == 1);
    assert(p.events.getByType(EV_META_TX_EXECUTED).size() == 1);
}

// ----------------------------------------------------------------------------

void test_concurrency_tally()
{
    Log::i("(Test) - Parallel voters");

    TestPlatform p;
    uint64_t id = p.createElection();
    p.openPolls();

    boost::mutex mutex;
    unsigned int accepted = 0;

    // 150 distinct voters spread over the three candidates
    boost::thread_group threads;
    for (unsigned int i = 0; i < 150; i++)
        threads.create_thread(boost::bind(&castVote, &p.storage, testAddress(static_cast<unsigned char>(i + 1)),
                                          id, i % 3, &mutex, &accepted));
    threads.join_all();

    assert(accepted == 150);

    std::vector<uint64_t> counts;
    assert(p.storage.getAllVoteCounts(id, counts) == RC_OK);
    assert(counts.size() == 3);
    assert(counts[0] == 50 && counts[1] == 50 && counts[2] == 50);

    // sequence numbers are gap free
    std::vector<EventPtr> all = p.events.getAll();
    for (size_t i = 0; i < all.size(); i++)
        assert(all[i]->getSequence() == i + 1);

    // each count update directly follows its vote
    for (size_t i = 0; i < all.size(); i++)
    {
        if (all[i]->getType() == EV_VOTE_CAST)
            assert(i + 1 < all.size() && all[i + 1]->getType() == EV_VOTE_COUNT_UPDATED);
    }
}

// ----------------------------------------------------------------------------

void test_concurrency()
{
    Log::i("(Test) # Test: Concurrency");
    test_concurrency_same_voter();
    test_concurrency_same_nonce();
    test_concurrency_tally();
}
