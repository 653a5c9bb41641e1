/*=============================================================================

The two administrative capabilities of the platform. The platform admin
capability is fixed when the registry is created; the store owner
capability is established once and may be transferred afterwards.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_CAPABILITY_H
#define EKURA_CAPABILITY_H

#include "crypto/fixedbytes.h"

#include <boost/serialization/access.hpp>

// ----------------------------------------------------------------
// Authority over org admin grants and election status
class PlatformAdminCapability
{
public:
    PlatformAdminCapability() {}

    explicit PlatformAdminCapability(const Address& holder):
        holder(holder) {}

    bool isHeldBy(const Address& address) const
    {
        return !this->holder.IsNull() && this->holder == address;
    }

    const Address& getHolder() const { return holder; }

private:
    Address holder;

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->holder;
    }
};

// ----------------------------------------------------------------
// Authority over pause, registry reference and ownership of the ballot store
class StoreOwnerCapability
{
public:
    StoreOwnerCapability() {}

    bool isHeldBy(const Address& address) const
    {
        return !this->holder.IsNull() && this->holder == address;
    }

    const Address& getHolder() const { return holder; }

    // Returns the previous holder
    Address transferTo(const Address& newHolder)
    {
        Address previous = this->holder;
        this->holder = newHolder;
        return previous;
    }

private:
    Address holder;

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->holder;
    }
};

#endif // EKURA_CAPABILITY_H
