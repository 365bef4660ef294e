#pragma once

#include "basic_types.hpp"

#ifndef _WIN32
namespace duplex {
    /** What a Readiness entry is waiting for */
    enum class Interest : int {
        read,
        write
    };

    /** One handle and what we want from it for one call to readiness_poll().

        Doesn't own the handle. An entry with kBadPipeValue is ignored by
        readiness_poll() and never reported ready.
    */
    struct Readiness {
        Readiness(){}
        Readiness(PipeHandle handle, Interest interest)
            : handle(handle), interest(interest) {}

        PipeHandle  handle      = kBadPipeValue;
        Interest    interest    = Interest::read;
        /** poll() revents from the last readiness_poll() */
        short       revents     = 0;

        /** True if the next read/write won't block. A hangup or error counts
            as ready, the read/write will then report EOF or the error.
        */
        bool ready() const;
    };

    /** Waits for any of the entries to become ready.

        @param entries  The entries to wait on, revents is filled in.
        @param count    number of entries
        @param seconds  The timeout in seconds. -1 to wait indefinately.
                        Rounded up to the next millisecond.

        @returns number of ready entries, 0 on timeout, -1 on error in which
                 case errno is set. EINTR is reported as an error as well.
    */
    int readiness_poll(Readiness* entries, int count, double seconds);
}
#endif
