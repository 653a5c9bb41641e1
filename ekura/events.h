/*=============================================================================

Notifications emitted by the registry and the ballot store after a
successful commit. All events are appended to a shared, append-only event
log and numbered sequentially. Listeners subscribed to the log are notified
synchronously after each append; they must not call back into the emitting
component.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_EVENTS_H
#define EKURA_EVENTS_H

#include "crypto/fixedbytes.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include <boost/serialization/access.hpp>
#include <boost/serialization/assume_abstract.hpp>
#include <boost/serialization/base_object.hpp>
#include <boost/serialization/export.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/shared_ptr.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

// ----------------------------------------------------------------
enum EventType
{
    EV_NONE,
    EV_ELECTION_CREATED,            // registry: new election
    EV_ORG_ADMIN_ADDED,             // registry: admin granted
    EV_ORG_ADMIN_REMOVED,           // registry: admin revoked
    EV_ELECTION_STATUS_CHANGED,     // registry: active flag toggled
    EV_VOTE_CAST,                   // ballot store: vote recorded
    EV_VOTE_COUNT_UPDATED,          // ballot store: tally incremented
    EV_META_TX_EXECUTED,            // ballot store: signed payload relayed
    EV_ELECTION_FACTORY_UPDATED,    // ballot store: registry reference swapped
    EV_INITIALIZED,                 // ballot store: one-time initialization
    EV_PAUSED,                      // ballot store: paused
    EV_UNPAUSED,                    // ballot store: unpaused
    EV_OWNERSHIP_TRANSFERRED        // ballot store: owner changed
};

// ----------------------------------------------------------------
// Name of the event (e.g. "VoteCast")
std::string printEventType(const EventType type);

// ----------------------------------------------------------------
class Event
{
public:
    Event(EventType type = EV_NONE):
        type(type) {}
    virtual ~Event() {}

    // ----------------------------------------------------------------

    inline EventType getType() const
    {
        return this->type;
    }

    // Position in the event log (starting at 1, 0 if not yet appended)
    inline uint64_t getSequence() const
    {
        return this->sequence;
    }

    // ----------------------------------------------------------------

    virtual std::string toString() const = 0;

private:

    EventType type;

    uint64_t sequence = 0;

    friend class EventLog;

    // ----------------------------------------------------------------

    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->type;
        a & this->sequence;
    }
};

BOOST_SERIALIZATION_ASSUME_ABSTRACT(Event)
BOOST_CLASS_EXPORT_KEY(Event)

typedef boost::shared_ptr<Event> EventPtr;

// ================================================================
// Registry events

class ElectionCreatedEvent : public Event
{
public:
    uint64_t orgId = 0;
    uint64_t electionId = 0;
    std::string name;
    Address creator;
    int64_t startTime = 0;
    int64_t endTime = 0;

    ElectionCreatedEvent():
        Event(EV_ELECTION_CREATED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->orgId;
        a & this->electionId;
        a & this->name;
        a & this->creator;
        a & this->startTime;
        a & this->endTime;
    }
};

BOOST_CLASS_EXPORT_KEY(ElectionCreatedEvent)

// ----------------------------------------------------------------
// Used for both grants and revocations, distinguished by the event type
class OrgAdminEvent : public Event
{
public:
    uint64_t orgId = 0;
    Address admin;

    // Platform admin who granted or revoked
    Address changedBy;

    OrgAdminEvent(EventType type = EV_ORG_ADMIN_ADDED):
        Event(type) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->orgId;
        a & this->admin;
        a & this->changedBy;
    }
};

BOOST_CLASS_EXPORT_KEY(OrgAdminEvent)

// ----------------------------------------------------------------
class ElectionStatusChangedEvent : public Event
{
public:
    uint64_t electionId = 0;
    bool isActive = false;
    Address changedBy;

    ElectionStatusChangedEvent():
        Event(EV_ELECTION_STATUS_CHANGED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->electionId;
        a & this->isActive;
        a & this->changedBy;
    }
};

BOOST_CLASS_EXPORT_KEY(ElectionStatusChangedEvent)

// ================================================================
// Ballot store events

class VoteCastEvent : public Event
{
public:
    Address voter;
    uint64_t electionId = 0;
    uint64_t candidateId = 0;
    Hash256 voteHash;
    int64_t timestamp = 0;

    // Submitted by a relayer on behalf of the voter
    bool isDelegated = false;

    VoteCastEvent():
        Event(EV_VOTE_CAST) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->voter;
        a & this->electionId;
        a & this->candidateId;
        a & this->voteHash;
        a & this->timestamp;
        a & this->isDelegated;
    }
};

BOOST_CLASS_EXPORT_KEY(VoteCastEvent)

// ----------------------------------------------------------------
class VoteCountUpdatedEvent : public Event
{
public:
    uint64_t electionId = 0;
    uint64_t candidateId = 0;
    uint64_t newCount = 0;

    VoteCountUpdatedEvent():
        Event(EV_VOTE_COUNT_UPDATED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->electionId;
        a & this->candidateId;
        a & this->newCount;
    }
};

BOOST_CLASS_EXPORT_KEY(VoteCountUpdatedEvent)

// ----------------------------------------------------------------
class MetaTransactionExecutedEvent : public Event
{
public:
    Address voter;
    Address relayer;
    uint64_t electionId = 0;
    uint64_t nonce = 0;

    MetaTransactionExecutedEvent():
        Event(EV_META_TX_EXECUTED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->voter;
        a & this->relayer;
        a & this->electionId;
        a & this->nonce;
    }
};

BOOST_CLASS_EXPORT_KEY(MetaTransactionExecutedEvent)

// ----------------------------------------------------------------
class ElectionFactoryUpdatedEvent : public Event
{
public:
    Address oldAddress;
    Address newAddress;
    Address changedBy;

    ElectionFactoryUpdatedEvent():
        Event(EV_ELECTION_FACTORY_UPDATED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->oldAddress;
        a & this->newAddress;
        a & this->changedBy;
    }
};

BOOST_CLASS_EXPORT_KEY(ElectionFactoryUpdatedEvent)

// ----------------------------------------------------------------
class InitializedEvent : public Event
{
public:
    Address owner;

    // Null if initialized without a registry
    Address factory;

    InitializedEvent():
        Event(EV_INITIALIZED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->owner;
        a & this->factory;
    }
};

BOOST_CLASS_EXPORT_KEY(InitializedEvent)

// ----------------------------------------------------------------
// Used for pause and unpause, distinguished by the event type
class PauseEvent : public Event
{
public:
    Address account;

    PauseEvent(EventType type = EV_PAUSED):
        Event(type) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->account;
    }
};

BOOST_CLASS_EXPORT_KEY(PauseEvent)

// ----------------------------------------------------------------
class OwnershipTransferredEvent : public Event
{
public:
    Address previousOwner;
    Address newOwner;

    OwnershipTransferredEvent():
        Event(EV_OWNERSHIP_TRANSFERRED) {}

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object<Event>(*this);
        a & this->previousOwner;
        a & this->newOwner;
    }
};

BOOST_CLASS_EXPORT_KEY(OwnershipTransferredEvent)

// ================================================================

class EventLog
{
public:
    typedef boost::function<void (const EventPtr&)> Listener;

    EventLog() {}

    // Append the event, assign its sequence number and notify all listeners.
    // Exceptions thrown by listeners are logged and do not propagate.
    void emit(const EventPtr& event);

    std::vector<EventPtr> getAll() const;

    std::vector<EventPtr> getByType(EventType type) const;

    size_t size() const;

    void subscribe(const Listener& listener);

private:
    mutable boost::mutex mutex;

    std::vector<EventPtr> events;

    std::vector<Listener> listeners;

    EventLog(const EventLog&);
    void operator=(const EventLog&);

    // ----------------------------------------------------------------

    friend class boost::serialization::access;

    template<typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        boost::mutex::scoped_lock lock(this->mutex);
        a & this->events;
    }
};

#endif // EKURA_EVENTS_H
