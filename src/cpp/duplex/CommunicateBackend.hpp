#pragma once

#include <string>

#include "basic_types.hpp"
#include "timing.hpp"

namespace duplex {
    /** Why CommunicateBackend::read_some() returned */
    enum class ReadStatus : int {
        finished,       ///< every stream reached EOF or finished writing
        size_limit,     ///< the byte quota for this call was reached
        timeout,        ///< the deadline passed
        error           ///< an I/O failure, see ReadOutcome::error_code
    };

    struct ReadOutcome {
        ReadStatus  status      = ReadStatus::finished;
        /** errno or GetLastError() for ReadStatus::error */
        int         error_code  = 0;
    };

    /** One way of moving data between us and the child without deadlocking.

        Owns the handles it was created with. Implementations keep enough
        state that read_some() can be called again after any return and
        carry on exactly where the last call stopped.
    */
    class CommunicateBackend {
    public:
        virtual ~CommunicateBackend(){}

        /** Writes pending input and reads output until done, the quota is
            reached or the deadline passes.

            @param deadline when to give up with ReadStatus::timeout
            @param quota    most bytes to append to cout and cerr combined,
                            -1 for no limit.
            @param cout     output from the child's stdout is appended here
            @param cerr     output from the child's stderr is appended here

            @return why it stopped. cout & cerr hold everything captured
                    regardless of status.
        */
        virtual ReadOutcome read_some(const Deadline& deadline, ssize_t quota,
            std::string& cout, std::string& cerr) = 0;

        /** @return true once all streams are in a terminal state */
        virtual bool done() const = 0;
    };
}
