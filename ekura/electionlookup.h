/*=============================================================================

Read-only view of the election registry as used by the ballot store.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_ELECTIONLOOKUP_H
#define EKURA_ELECTIONLOOKUP_H

#include "election.h"
#include "result.h"
#include "crypto/fixedbytes.h"

#include <stdint.h>

// ----------------------------------------------------------------
class ElectionLookup
{
public:
    virtual ~ElectionLookup() {}

    // Address of the registry
    virtual Address getAddress() const = 0;

    // RC_ELECTION_NOT_FOUND for unknown ids
    virtual ResultCode getElection(uint64_t electionId, Election& electionOut) const = 0;

    // Active flag set and now within the voting window
    virtual ResultCode isElectionActive(uint64_t electionId, bool& activeOut) const = 0;

    // Existence, active verdict and candidate count evaluated atomically
    virtual ResultCode getVotingSnapshot(uint64_t electionId, ElectionSnapshot& snapshotOut) const = 0;
};

#endif // EKURA_ELECTIONLOOKUP_H
