#include "result.h"

std::string resultName(const ResultCode result)
{
    switch(result)
    {
    case RC_OK:                         return "Ok";
    case RC_NOT_PLATFORM_ADMIN:         return "NotPlatformAdmin";
    case RC_NOT_ORG_ADMIN:              return "NotOrgAdmin";
    case RC_NOT_OWNER:                  return "NotOwner";
    case RC_INVALID_ADMIN_ADDRESS:      return "InvalidAdminAddress";
    case RC_EMPTY_INPUT:                return "EmptyInput";
    case RC_NO_CANDIDATES:              return "NoCandidatesProvided";
    case RC_INVALID_TIME_RANGE:         return "InvalidTimeRange";
    case RC_START_TIME_NOT_IN_FUTURE:   return "StartTimeMustBeInFuture";
    case RC_INVALID_CANDIDATE:          return "InvalidCandidate";
    case RC_INVALID_FACTORY_ADDRESS:    return "InvalidFactoryAddress";
    case RC_INVALID_OWNER_ADDRESS:      return "InvalidOwnerAddress";
    case RC_ALREADY_ADMIN:              return "AlreadyAnAdmin";
    case RC_NOT_ADMIN:                  return "NotAnAdmin";
    case RC_ALREADY_VOTED:              return "AlreadyVoted";
    case RC_ELECTION_NOT_FOUND:         return "ElectionNotFound";
    case RC_ELECTION_NOT_ACTIVE:        return "ElectionNotActive";
    case RC_FACTORY_NOT_SET:            return "ElectionFactoryNotSet";
    case RC_ALREADY_INITIALIZED:        return "AlreadyInitialized";
    case RC_INVALID_SIGNATURE:          return "InvalidSignature";
    case RC_SIGNATURE_EXPIRED:          return "SignatureExpired";
    case RC_INVALID_NONCE:              return "InvalidNonce";
    case RC_PAUSED:                     return "Paused";
    case RC_NOT_PAUSED:                 return "NotPaused";
    default: break;
    }

    return "Unknown";
}

// ----------------------------------------------------------------

std::string printResultCode(const ResultCode result)
{
    switch(result)
    {
    case RC_OK:
        return "Operation was successful";
    case RC_NOT_PLATFORM_ADMIN:
        return "Caller is not the platform admin";
    case RC_NOT_ORG_ADMIN:
        return "Caller is not an admin of this organization";
    case RC_NOT_OWNER:
        return "Caller is not the owner of the ballot store";
    case RC_INVALID_ADMIN_ADDRESS:
        return "Admin address must not be null";
    case RC_EMPTY_INPUT:
        return "Election name must not be empty";
    case RC_NO_CANDIDATES:
        return "At least one candidate must be provided";
    case RC_INVALID_TIME_RANGE:
        return "End time must be after start time";
    case RC_START_TIME_NOT_IN_FUTURE:
        return "Start time must be in the future";
    case RC_INVALID_CANDIDATE:
        return "Candidate does not exist in this election";
    case RC_INVALID_FACTORY_ADDRESS:
        return "Election factory address must not be null";
    case RC_INVALID_OWNER_ADDRESS:
        return "New owner must not be null";
    case RC_ALREADY_ADMIN:
        return "Address is already an admin of this organization";
    case RC_NOT_ADMIN:
        return "Address is not an admin of this organization";
    case RC_ALREADY_VOTED:
        return "Voter has already voted in this election";
    case RC_ELECTION_NOT_FOUND:
        return "Election does not exist";
    case RC_ELECTION_NOT_ACTIVE:
        return "Election is not active";
    case RC_FACTORY_NOT_SET:
        return "Election factory is not set";
    case RC_ALREADY_INITIALIZED:
        return "Ballot store is already initialized";
    case RC_INVALID_SIGNATURE:
        return "Signature does not match the voter";
    case RC_SIGNATURE_EXPIRED:
        return "Signature deadline has passed";
    case RC_INVALID_NONCE:
        return "Nonce does not match the voter's current nonce";
    case RC_PAUSED:
        return "Ballot store is paused";
    case RC_NOT_PAUSED:
        return "Ballot store is not paused";
    default: break;
    }

    return "ResultCode - Unknown";
}
