/*=============================================================================

Result codes of all registry and ballot store operations. Every rejected
operation leaves the state exactly as it was before the call.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_RESULT_H
#define EKURA_RESULT_H

#include <string>

// ----------------------------------------------------------------
enum ResultCode
{
    RC_OK,                          // everything is fine

    // authorization
    RC_NOT_PLATFORM_ADMIN,          // caller lacks the platform admin capability
    RC_NOT_ORG_ADMIN,               // caller is no admin of the organization
    RC_NOT_OWNER,                   // caller lacks the store owner capability

    // input validation
    RC_INVALID_ADMIN_ADDRESS,       // admin address is null
    RC_EMPTY_INPUT,                 // election name is empty
    RC_NO_CANDIDATES,               // candidate list is empty
    RC_INVALID_TIME_RANGE,          // end time not after start time
    RC_START_TIME_NOT_IN_FUTURE,    // start time not after current time
    RC_INVALID_CANDIDATE,           // candidate index out of range
    RC_INVALID_FACTORY_ADDRESS,     // registry reference is null
    RC_INVALID_OWNER_ADDRESS,       // new owner is null

    // state conflicts
    RC_ALREADY_ADMIN,               // address already admin of the organization
    RC_NOT_ADMIN,                   // address is no admin of the organization
    RC_ALREADY_VOTED,               // voter already voted in this election
    RC_ELECTION_NOT_FOUND,          // unknown election id
    RC_ELECTION_NOT_ACTIVE,         // election disabled or outside its time window
    RC_FACTORY_NOT_SET,             // ballot store has no registry reference
    RC_ALREADY_INITIALIZED,         // initialize was already called

    // authentication
    RC_INVALID_SIGNATURE,           // signature does not recover to the voter
    RC_SIGNATURE_EXPIRED,           // payload deadline has passed
    RC_INVALID_NONCE,               // payload nonce differs from the voter's nonce

    // availability
    RC_PAUSED,                      // ballot store is paused
    RC_NOT_PAUSED                   // ballot store is not paused
};

// ----------------------------------------------------------------
// Name of the failure condition (e.g. "AlreadyVoted")
std::string resultName(const ResultCode result);

// Human readable description
std::string printResultCode(const ResultCode result);

#endif // EKURA_RESULT_H
