#include "tests/test_factory.h"
#include "tests/test_helpers.h"

#include "helper.h"

#include <boost/pointer_cast.hpp>

#include <cassert>

// ----------------------------------------------------------------------------

void test_factory_admins()
{
    Log::i("(Test) - Org admin management");

    ManualClock clock;
    EventLog events;
    Address platformAdmin = testAddress(0xA1);
    Address admin = testAddress(0xB1);
    Address stranger = testAddress(0xC1);

    ElectionFactory factory(testAddress(0xF1), platformAdmin, clock, events);
    assert(factory.getPlatformAdmin() == platformAdmin);
    assert(factory.getAddress() == testAddress(0xF1));

    // unknown organizations have no admins and no elections
    assert(!factory.isOrgAdmin(7, admin));
    assert(factory.getOrganizationElections(7).empty());
    Organization organization;
    assert(!factory.getOrganization(7, organization));

    // only the platform admin grants
    assert(factory.addOrgAdmin(stranger, 7, admin) == RC_NOT_PLATFORM_ADMIN);
    assert(factory.addOrgAdmin(platformAdmin, 7, Address()) == RC_INVALID_ADMIN_ADDRESS);
    assert(events.size() == 0);

    assert(factory.addOrgAdmin(platformAdmin, 7, admin) == RC_OK);
    assert(factory.isOrgAdmin(7, admin));
    assert(!factory.isOrgAdmin(8, admin));
    assert(factory.addOrgAdmin(platformAdmin, 7, admin) == RC_ALREADY_ADMIN);

    std::vector<EventPtr> added = events.getByType(EV_ORG_ADMIN_ADDED);
    assert(added.size() == 1);
    boost::shared_ptr<OrgAdminEvent> event = boost::dynamic_pointer_cast<OrgAdminEvent>(added[0]);
    assert(event && event->orgId == 7 && event->admin == admin && event->changedBy == platformAdmin);
    assert(event->getSequence() == 1);

    // organization aggregate is created on the first grant
    assert(factory.getOrganization(7, organization));
    assert(organization.id == 7 && organization.admins.size() == 1 && organization.electionIds.empty());

    // revocation
    assert(factory.removeOrgAdmin(stranger, 7, admin) == RC_NOT_PLATFORM_ADMIN);
    assert(factory.removeOrgAdmin(platformAdmin, 7, stranger) == RC_NOT_ADMIN);
    assert(factory.removeOrgAdmin(platformAdmin, 9, admin) == RC_NOT_ADMIN);
    assert(factory.removeOrgAdmin(platformAdmin, 7, admin) == RC_OK);
    assert(!factory.isOrgAdmin(7, admin));
    assert(factory.removeOrgAdmin(platformAdmin, 7, admin) == RC_NOT_ADMIN);
    assert(events.getByType(EV_ORG_ADMIN_REMOVED).size() == 1);

    // the organization stays after its last admin is gone
    assert(factory.getOrganization(7, organization));
    assert(organization.admins.empty());

    // the platform admin is no org admin by default
    assert(!factory.isOrgAdmin(7, platformAdmin));
}

// ----------------------------------------------------------------------------

void test_factory_create_election()
{
    Log::i("(Test) - Election creation");

    TestPlatform p;
    size_t eventsBefore = p.events.size();

    Candidates candidates = threeCandidates();
    int64_t start = TEST_T0 + ONE_HOUR;
    int64_t end = TEST_T0 + 7 * ONE_DAY;
    uint64_t electionId = 0;

    // authorization before validation
    assert(p.factory.createElection(p.platformAdmin, TEST_ORG, "x", "", start, end, candidates, electionId) == RC_NOT_ORG_ADMIN);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG + 1, "x", "", start, end, candidates, electionId) == RC_NOT_ORG_ADMIN);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "", "", TEST_T0, TEST_T0, Candidates(), electionId) == RC_EMPTY_INPUT);

    // validation order: name, start, range, candidates
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", TEST_T0, TEST_T0 - 1, Candidates(), electionId) == RC_START_TIME_NOT_IN_FUTURE);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", TEST_T0 - 5, end, candidates, electionId) == RC_START_TIME_NOT_IN_FUTURE);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", start, start, Candidates(), electionId) == RC_INVALID_TIME_RANGE);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", start, start - 1, candidates, electionId) == RC_INVALID_TIME_RANGE);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", start, end, Candidates(), electionId) == RC_NO_CANDIDATES);

    // failures leave no trace
    assert(electionId == 0);
    assert(p.factory.getTotalElections() == 0);
    assert(p.factory.getOrganizationElections(TEST_ORG).empty());
    assert(p.events.size() == eventsBefore);

    // start one second in the future is fine
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "Board", "desc", TEST_T0 + 1, end, candidates, electionId) == RC_OK);
    assert(electionId == 1);

    Election election;
    assert(p.factory.getElection(1, election) == RC_OK);
    assert(election.id == 1 && election.orgId == TEST_ORG);
    assert(election.name == "Board" && election.description == "desc");
    assert(election.startTime == TEST_T0 + 1 && election.endTime == end);
    assert(election.isActive);
    assert(election.candidates == candidates);
    assert(election.creator == p.orgAdmin);
    assert(election.createdAt == TEST_T0);

    std::vector<EventPtr> created = p.events.getByType(EV_ELECTION_CREATED);
    assert(created.size() == 1);
    boost::shared_ptr<ElectionCreatedEvent> event = boost::dynamic_pointer_cast<ElectionCreatedEvent>(created[0]);
    assert(event && event->electionId == 1 && event->orgId == TEST_ORG && event->name == "Board");
    assert(event->creator == p.orgAdmin && event->startTime == TEST_T0 + 1 && event->endTime == end);

    // ids are sequential and listed per organization in creation order
    assert(p.createElection() == 2);
    assert(p.createElection() == 3);
    assert(p.factory.getTotalElections() == 3);

    std::vector<uint64_t> ids = p.factory.getOrganizationElections(TEST_ORG);
    assert(ids.size() == 3 && ids[0] == 1 && ids[1] == 2 && ids[2] == 3);

    // unknown ids
    assert(p.factory.getElection(0, election) == RC_ELECTION_NOT_FOUND);
    assert(p.factory.getElection(4, election) == RC_ELECTION_NOT_FOUND);

    // a revoked admin can not create anymore
    assert(p.factory.removeOrgAdmin(p.platformAdmin, TEST_ORG, p.orgAdmin) == RC_OK);
    assert(p.factory.createElection(p.orgAdmin, TEST_ORG, "x", "", start, end, candidates, electionId) == RC_NOT_ORG_ADMIN);
    assert(p.factory.getTotalElections() == 3);
}

// ----------------------------------------------------------------------------

void test_factory_status()
{
    Log::i("(Test) - Election status and time window");

    TestPlatform p;
    uint64_t id = p.createElection();
    bool active = true;

    // before the window
    assert(p.factory.isElectionActive(id, active) == RC_OK);
    assert(!active);

    // window bounds are inclusive
    p.clock.set(TEST_T0 + ONE_HOUR - 1);
    assert(p.factory.isElectionActive(id, active) == RC_OK && !active);
    p.clock.set(TEST_T0 + ONE_HOUR);
    assert(p.factory.isElectionActive(id, active) == RC_OK && active);
    p.clock.set(TEST_T0 + 7 * ONE_DAY);
    assert(p.factory.isElectionActive(id, active) == RC_OK && active);
    p.clock.set(TEST_T0 + 7 * ONE_DAY + 1);
    assert(p.factory.isElectionActive(id, active) == RC_OK && !active);

    assert(p.factory.isElectionActive(99, active) == RC_ELECTION_NOT_FOUND);

    // toggling
    p.openPolls();
    assert(p.factory.toggleElectionStatus(p.orgAdmin, id) == RC_NOT_PLATFORM_ADMIN);
    assert(p.factory.toggleElectionStatus(p.platformAdmin, 99) == RC_ELECTION_NOT_FOUND);

    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(p.factory.isElectionActive(id, active) == RC_OK && !active);

    ElectionSnapshot snapshot;
    assert(p.factory.getVotingSnapshot(id, snapshot) == RC_OK);
    assert(!snapshot.isActive && snapshot.candidateCount == 3 && snapshot.electionId == id);

    assert(p.factory.toggleElectionStatus(p.platformAdmin, id) == RC_OK);
    assert(p.factory.getVotingSnapshot(id, snapshot) == RC_OK && snapshot.isActive);
    assert(p.factory.getVotingSnapshot(99, snapshot) == RC_ELECTION_NOT_FOUND);

    std::vector<EventPtr> changes = p.events.getByType(EV_ELECTION_STATUS_CHANGED);
    assert(changes.size() == 2);
    boost::shared_ptr<ElectionStatusChangedEvent> first = boost::dynamic_pointer_cast<ElectionStatusChangedEvent>(changes[0]);
    boost::shared_ptr<ElectionStatusChangedEvent> second = boost::dynamic_pointer_cast<ElectionStatusChangedEvent>(changes[1]);
    assert(first && !first->isActive && first->changedBy == p.platformAdmin);
    assert(second && second->isActive);
    assert(first->getSequence() < second->getSequence());
}

// ----------------------------------------------------------------------------

void test_factory()
{
    Log::i("(Test) # Test: Election registry");
    test_factory_admins();
    test_factory_create_election();
    test_factory_status();
}
