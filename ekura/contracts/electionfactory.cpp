#include "contracts/electionfactory.h"

#include "helper.h"

#include <boost/make_shared.hpp>

// ================================================================

static ResultCode
reject(const char* operation, const Address& caller, ResultCode result)
{
    Log::w("(ElectionFactory) %s by %s rejected: %s", operation,
           caller.ToString().c_str(), resultName(result).c_str());
    return result;
}

// ================================================================

ElectionFactory::ElectionFactory(const Address& self, const Address& platformAdmin,
                                 const Clock& clock, EventLog& eventLog):
    self(self),
    platformAdmin(platformAdmin),
    clock(clock),
    eventLog(eventLog)
{
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::addOrgAdmin(const Address& caller, uint64_t orgId, const Address& admin)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->platformAdmin.isHeldBy(caller))
        return reject("addOrgAdmin", caller, RC_NOT_PLATFORM_ADMIN);

    if (admin.IsNull())
        return reject("addOrgAdmin", caller, RC_INVALID_ADMIN_ADDRESS);

    std::map<uint64_t, Organization>::const_iterator it = this->organizations.find(orgId);
    if (it != this->organizations.end() && it->second.isAdmin(admin))
        return reject("addOrgAdmin", caller, RC_ALREADY_ADMIN);

    // commit
    this->getOrCreateOrganization(orgId).admins.insert(admin);

    Log::i("(ElectionFactory) Added admin %s to organization %llu",
           admin.ToString().c_str(), (unsigned long long) orgId);

    boost::shared_ptr<OrgAdminEvent> event = boost::make_shared<OrgAdminEvent>(EV_ORG_ADMIN_ADDED);
    event->orgId = orgId;
    event->admin = admin;
    event->changedBy = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::removeOrgAdmin(const Address& caller, uint64_t orgId, const Address& admin)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->platformAdmin.isHeldBy(caller))
        return reject("removeOrgAdmin", caller, RC_NOT_PLATFORM_ADMIN);

    std::map<uint64_t, Organization>::iterator it = this->organizations.find(orgId);
    if (it == this->organizations.end() || !it->second.isAdmin(admin))
        return reject("removeOrgAdmin", caller, RC_NOT_ADMIN);

    // commit, the organization itself is kept
    it->second.admins.erase(admin);

    Log::i("(ElectionFactory) Removed admin %s from organization %llu",
           admin.ToString().c_str(), (unsigned long long) orgId);

    boost::shared_ptr<OrgAdminEvent> event = boost::make_shared<OrgAdminEvent>(EV_ORG_ADMIN_REMOVED);
    event->orgId = orgId;
    event->admin = admin;
    event->changedBy = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::toggleElectionStatus(const Address& caller, uint64_t electionId)
{
    boost::mutex::scoped_lock lock(this->mutex);

    if (!this->platformAdmin.isHeldBy(caller))
        return reject("toggleElectionStatus", caller, RC_NOT_PLATFORM_ADMIN);

    std::map<uint64_t, Election>::iterator it = this->elections.find(electionId);
    if (it == this->elections.end())
        return reject("toggleElectionStatus", caller, RC_ELECTION_NOT_FOUND);

    Election& election = it->second;
    election.isActive = !election.isActive;

    Log::i("(ElectionFactory) Election %llu is now %s",
           (unsigned long long) electionId, election.isActive ? "active" : "inactive");

    boost::shared_ptr<ElectionStatusChangedEvent> event = boost::make_shared<ElectionStatusChangedEvent>();
    event->electionId = electionId;
    event->isActive = election.isActive;
    event->changedBy = caller;
    this->eventLog.emit(event);

    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::createElection(const Address& caller, uint64_t orgId,
                                const std::string& name, const std::string& description,
                                int64_t startTime, int64_t endTime,
                                const Candidates& candidates, uint64_t& electionIdOut)
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Organization>::const_iterator it = this->organizations.find(orgId);
    if (it == this->organizations.end() || !it->second.isAdmin(caller))
        return reject("createElection", caller, RC_NOT_ORG_ADMIN);

    int64_t now = this->clock.now();

    if (name.empty())
        return reject("createElection", caller, RC_EMPTY_INPUT);

    if (startTime <= now)
        return reject("createElection", caller, RC_START_TIME_NOT_IN_FUTURE);

    if (endTime <= startTime)
        return reject("createElection", caller, RC_INVALID_TIME_RANGE);

    if (candidates.empty())
        return reject("createElection", caller, RC_NO_CANDIDATES);

    // commit
    Election election;
    election.orgId = orgId;
    election.id = this->nextElectionId++;
    election.name = name;
    election.description = description;
    election.startTime = startTime;
    election.endTime = endTime;
    election.isActive = true;
    election.candidates = candidates;
    election.creator = caller;
    election.createdAt = now;

    this->elections[election.id] = election;
    this->getOrCreateOrganization(orgId).electionIds.push_back(election.id);

    electionIdOut = election.id;

    Log::i("(ElectionFactory) Created election %llu \"%s\" for organization %llu (%lu candidates)",
           (unsigned long long) election.id, name.c_str(), (unsigned long long) orgId,
           (unsigned long) candidates.size());

    boost::shared_ptr<ElectionCreatedEvent> event = boost::make_shared<ElectionCreatedEvent>();
    event->orgId = orgId;
    event->electionId = election.id;
    event->name = name;
    event->creator = caller;
    event->startTime = startTime;
    event->endTime = endTime;
    this->eventLog.emit(event);

    return RC_OK;
}

// ================================================================

Address
ElectionFactory::getAddress() const
{
    return this->self;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::getElection(uint64_t electionId, Election& electionOut) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Election>::const_iterator it = this->elections.find(electionId);
    if (it == this->elections.end())
        return RC_ELECTION_NOT_FOUND;

    electionOut = it->second;
    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::isElectionActive(uint64_t electionId, bool& activeOut) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Election>::const_iterator it = this->elections.find(electionId);
    if (it == this->elections.end())
        return RC_ELECTION_NOT_FOUND;

    activeOut = it->second.isOpenAt(this->clock.now());
    return RC_OK;
}

// ----------------------------------------------------------------

ResultCode
ElectionFactory::getVotingSnapshot(uint64_t electionId, ElectionSnapshot& snapshotOut) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Election>::const_iterator it = this->elections.find(electionId);
    if (it == this->elections.end())
        return RC_ELECTION_NOT_FOUND;

    snapshotOut.electionId = electionId;
    snapshotOut.isActive = it->second.isOpenAt(this->clock.now());
    snapshotOut.candidateCount = it->second.candidates.size();
    return RC_OK;
}

// ----------------------------------------------------------------

std::vector<uint64_t>
ElectionFactory::getOrganizationElections(uint64_t orgId) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Organization>::const_iterator it = this->organizations.find(orgId);
    if (it == this->organizations.end())
        return std::vector<uint64_t>();

    return it->second.electionIds;
}

// ----------------------------------------------------------------

bool
ElectionFactory::isOrgAdmin(uint64_t orgId, const Address& address) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Organization>::const_iterator it = this->organizations.find(orgId);
    return it != this->organizations.end() && it->second.isAdmin(address);
}

// ----------------------------------------------------------------

bool
ElectionFactory::getOrganization(uint64_t orgId, Organization& organizationOut) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<uint64_t, Organization>::const_iterator it = this->organizations.find(orgId);
    if (it == this->organizations.end())
        return false;

    organizationOut = it->second;
    return true;
}

// ----------------------------------------------------------------

Address
ElectionFactory::getPlatformAdmin() const
{
    return this->platformAdmin.getHolder();
}

// ----------------------------------------------------------------

uint64_t
ElectionFactory::getTotalElections() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->nextElectionId - 1;
}

// ================================================================

Organization&
ElectionFactory::getOrCreateOrganization(uint64_t orgId)
{
    std::map<uint64_t, Organization>::iterator it = this->organizations.find(orgId);
    if (it != this->organizations.end())
        return it->second;

    Organization& organization = this->organizations[orgId];
    organization.id = orgId;
    return organization;
}
