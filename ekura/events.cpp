#include "events.h"
#include "helper.h"

#include <sstream>
#include <stdexcept>

#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/foreach.hpp>

BOOST_CLASS_EXPORT_IMPLEMENT(ElectionCreatedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(OrgAdminEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(ElectionStatusChangedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(VoteCastEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(VoteCountUpdatedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(MetaTransactionExecutedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(ElectionFactoryUpdatedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(InitializedEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(PauseEvent)
BOOST_CLASS_EXPORT_IMPLEMENT(OwnershipTransferredEvent)

// ================================================================

std::string printEventType(const EventType type)
{
    switch(type)
    {
    case EV_ELECTION_CREATED:           return "ElectionCreated";
    case EV_ORG_ADMIN_ADDED:            return "OrgAdminAdded";
    case EV_ORG_ADMIN_REMOVED:          return "OrgAdminRemoved";
    case EV_ELECTION_STATUS_CHANGED:    return "ElectionStatusChanged";
    case EV_VOTE_CAST:                  return "VoteCast";
    case EV_VOTE_COUNT_UPDATED:         return "VoteCountUpdated";
    case EV_META_TX_EXECUTED:           return "MetaTransactionExecuted";
    case EV_ELECTION_FACTORY_UPDATED:   return "ElectionFactoryUpdated";
    case EV_INITIALIZED:                return "Initialized";
    case EV_PAUSED:                     return "Paused";
    case EV_UNPAUSED:                   return "Unpaused";
    case EV_OWNERSHIP_TRANSFERRED:      return "OwnershipTransferred";
    default: break;
    }

    return "None";
}

// ================================================================

std::string
ElectionCreatedEvent::toString() const
{
    std::stringstream ss;
    ss << "ElectionCreated {org=" << orgId << ", election=" << electionId
       << ", name=\"" << name << "\", creator=" << creator.ToString()
       << ", start=" << startTime << ", end=" << endTime << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
OrgAdminEvent::toString() const
{
    std::stringstream ss;
    ss << printEventType(getType()) << " {org=" << orgId
       << ", admin=" << admin.ToString() << ", by=" << changedBy.ToString() << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
ElectionStatusChangedEvent::toString() const
{
    std::stringstream ss;
    ss << "ElectionStatusChanged {election=" << electionId
       << ", active=" << (isActive ? "true" : "false")
       << ", by=" << changedBy.ToString() << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
VoteCastEvent::toString() const
{
    std::stringstream ss;
    ss << "VoteCast {voter=" << voter.ToString() << ", election=" << electionId
       << ", candidate=" << candidateId << ", hash=" << voteHash.GetHex()
       << ", time=" << timestamp << ", delegated=" << (isDelegated ? "true" : "false") << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
VoteCountUpdatedEvent::toString() const
{
    std::stringstream ss;
    ss << "VoteCountUpdated {election=" << electionId << ", candidate=" << candidateId
       << ", count=" << newCount << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
MetaTransactionExecutedEvent::toString() const
{
    std::stringstream ss;
    ss << "MetaTransactionExecuted {voter=" << voter.ToString()
       << ", relayer=" << relayer.ToString() << ", election=" << electionId
       << ", nonce=" << nonce << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
ElectionFactoryUpdatedEvent::toString() const
{
    std::stringstream ss;
    ss << "ElectionFactoryUpdated {old=" << oldAddress.ToString()
       << ", new=" << newAddress.ToString() << ", by=" << changedBy.ToString() << "}";
    return ss.str();
}

// ----------------------------------------------------------------

std::string
InitializedEvent::toString() const
{
    return "Initialized {owner=" + owner.ToString() + ", factory=" + factory.ToString() + "}";
}

// ----------------------------------------------------------------

std::string
PauseEvent::toString() const
{
    return printEventType(getType()) + " {account=" + account.ToString() + "}";
}

// ----------------------------------------------------------------

std::string
OwnershipTransferredEvent::toString() const
{
    return "OwnershipTransferred {previous=" + previousOwner.ToString() +
            ", new=" + newOwner.ToString() + "}";
}

// ================================================================

void
EventLog::emit(const EventPtr& event)
{
    if (!event)
        throw std::invalid_argument("Can not emit an empty event");

    std::vector<Listener> toNotify;
    {
        boost::mutex::scoped_lock lock(this->mutex);

        event->sequence = this->events.size() + 1;
        this->events.push_back(event);

        toNotify = this->listeners;
    }

    Log::i("(EventLog) #%llu %s", (unsigned long long) event->getSequence(), event->toString().c_str());

    // a failing listener must not hide the event from the others
    BOOST_FOREACH(const Listener& listener, toNotify)
    {
        try
        {
            listener(event);
        }
        catch (const std::exception& e)
        {
            Log::e("(EventLog) Listener failed on #%llu: %s",
                   (unsigned long long) event->getSequence(), e.what());
        }
    }
}

// ----------------------------------------------------------------

std::vector<EventPtr>
EventLog::getAll() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->events;
}

// ----------------------------------------------------------------

std::vector<EventPtr>
EventLog::getByType(EventType type) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::vector<EventPtr> result;
    BOOST_FOREACH(const EventPtr& event, this->events)
    {
        if (event->getType() == type)
            result.push_back(event);
    }

    return result;
}

// ----------------------------------------------------------------

size_t
EventLog::size() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->events.size();
}

// ----------------------------------------------------------------

void
EventLog::subscribe(const Listener& listener)
{
    boost::mutex::scoped_lock lock(this->mutex);
    this->listeners.push_back(listener);
}
