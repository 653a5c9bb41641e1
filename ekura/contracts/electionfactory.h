/*=============================================================================

The election registry. Maintains organizations with their admin sets and all
elections. The platform admin grants and revokes org admins and toggles the
active flag of elections; org admins create elections for their
organization. Every operation is validated completely before anything is
committed, so a rejected call leaves no trace.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_ELECTIONFACTORY_H
#define EKURA_ELECTIONFACTORY_H

#include "capability.h"
#include "clock.h"
#include "election.h"
#include "electionlookup.h"
#include "events.h"
#include "result.h"
#include "crypto/fixedbytes.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>

#include <boost/serialization/access.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/serialization.hpp>

class ElectionFactory : public ElectionLookup
{
public:
    ElectionFactory(const Address& self, const Address& platformAdmin,
                    const Clock& clock, EventLog& eventLog);

    // ----------------------------------------------------------------
    // Platform admin operations

    // Grant admin rights for the given organization
    ResultCode addOrgAdmin(const Address& caller, uint64_t orgId, const Address& admin);

    // Revoke admin rights for the given organization
    ResultCode removeOrgAdmin(const Address& caller, uint64_t orgId, const Address& admin);

    // Flip the active flag of an election
    ResultCode toggleElectionStatus(const Address& caller, uint64_t electionId);

    // ----------------------------------------------------------------
    // Org admin operations

    // Create a new election, the assigned id is written to electionIdOut
    ResultCode createElection(const Address& caller, uint64_t orgId,
                              const std::string& name, const std::string& description,
                              int64_t startTime, int64_t endTime,
                              const Candidates& candidates, uint64_t& electionIdOut);

    // ----------------------------------------------------------------
    // Reads

    Address getAddress() const;

    ResultCode getElection(uint64_t electionId, Election& electionOut) const;

    ResultCode isElectionActive(uint64_t electionId, bool& activeOut) const;

    ResultCode getVotingSnapshot(uint64_t electionId, ElectionSnapshot& snapshotOut) const;

    // Empty if the organization is unknown
    std::vector<uint64_t> getOrganizationElections(uint64_t orgId) const;

    bool isOrgAdmin(uint64_t orgId, const Address& address) const;

    // False if the organization is unknown
    bool getOrganization(uint64_t orgId, Organization& organizationOut) const;

    Address getPlatformAdmin() const;

    uint64_t getTotalElections() const;

private:
    Address self;

    PlatformAdminCapability platformAdmin;

    const Clock& clock;

    EventLog& eventLog;

    mutable boost::mutex mutex;

    std::map<uint64_t, Organization> organizations;

    std::map<uint64_t, Election> elections;

    // Id assigned to the next election
    uint64_t nextElectionId = 1;

    // Get or create the organization aggregate, requires the lock
    Organization& getOrCreateOrganization(uint64_t orgId);

    ElectionFactory(const ElectionFactory&);
    void operator=(const ElectionFactory&);

    // ----------------------------------------------------------------

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        boost::mutex::scoped_lock lock(this->mutex);
        a & this->self;
        a & this->platformAdmin;
        a & this->organizations;
        a & this->elections;
        a & this->nextElectionId;
    }
};

#endif // EKURA_ELECTIONFACTORY_H
