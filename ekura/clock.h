/*=============================================================================

Time source of the platform (UNIX time, sec). Components never read the
system time directly.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_CLOCK_H
#define EKURA_CLOCK_H

#include "helper.h"

#include <stdint.h>

// ----------------------------------------------------------------
class Clock
{
public:
    virtual ~Clock() {}

    virtual int64_t now() const = 0;
};

// ----------------------------------------------------------------
class SystemClock : public Clock
{
public:
    int64_t now() const
    {
        return Helper::GetUNIXTimestamp();
    }
};

#endif // EKURA_CLOCK_H
