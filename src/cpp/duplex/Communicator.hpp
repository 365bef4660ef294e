#pragma once

#include <memory>
#include <optional>
#include <string>

#include "basic_types.hpp"
#include "CommunicateBackend.hpp"

namespace duplex {
    /** Talks to a child over its stdin, stdout and stderr without
        deadlocking.

        Writing everything to a child before reading anything deadlocks as
        soon as the child fills its output pipe while we're still blocked
        writing its input. Communicator interleaves the two so any amount of
        data can flow both ways.

        read() can be bounded in bytes with limit_size() and in time with
        limit_time(). Either way the next read() carries on exactly where the
        last one stopped, no data is lost or repeated.

        @code
        duplex::Communicator comm(child_cin, child_cout, kBadPipeValue, input);
        comm.limit_size(64*1024);
        while (!comm.done()) {
            auto output = comm.read();
            consume(*output.cout);
        }
        @endcode
    */
    class Communicator {
    public:
        /** Takes ownership of the handles. Any of them may be kBadPipeValue
            if that stream is not redirected. Handles are switched to
            blocking mode.

            @param cin      write end of the child's stdin
            @param cout     read end of the child's stdout
            @param cerr     read end of the child's stderr
            @param input    data for cin. Must be given if and only if cin is.
            @param multiplexer  how to interleave the streams, default picks
                                the best for the platform.

            @throw std::invalid_argument if cin and input don't agree. The
                   handles are closed.
            @throw std::domain_error if multiplexer isn't available on this
                   platform. The handles are closed.
            @throw OSError if a handle can't be made blocking. The handles
                   are closed.
        */
        Communicator(PipeHandle cin, PipeHandle cout, PipeHandle cerr,
            std::optional<std::string> input,
            Multiplexer multiplexer=Multiplexer::automatic);
        Communicator(const Communicator&)=delete;
        Communicator& operator=(const Communicator&)=delete;
        Communicator(Communicator&&)=default;
        Communicator& operator=(Communicator&&)=default;
        /** Closes any handles still open. Never waits on the child. */
        ~Communicator();

        /** Limits how many bytes of cout and cerr combined one read() may
            capture. Anything over is kept for the next read().

            @param bytes    the limit, -1 for unlimited.

            @throw std::invalid_argument if bytes < -1
        */
        Communicator& limit_size(ssize_t bytes);
        /** Limits how long one read() may take. On expiry read() throws
            TimeoutExpired with what it captured so far.

            @param seconds  the limit, -1 for unlimited.
        */
        Communicator& limit_time(double seconds);

        ssize_t size_limit() const { return mSizeLimit; }
        double time_limit() const { return mTimeLimit; }
        Multiplexer multiplexer() const { return mMultiplexer; }

        /** Sends input and captures output until every stream is finished
            or a limit is hit.

            @return output captured by this call. cout/cerr are nullopt if
                    that stream was not given to the constructor.

            @throw TimeoutExpired   The time limit expired. Call read() again
                                    to continue.
            @throw CommunicateError An I/O error, that stream is finished.
            @throw std::domain_error if used after being moved from.
        */
        CommunicateOutput read();

        /** @return true once all streams hit EOF or an error and input is
                    fully written. Further read() calls return nothing.
        */
        bool done() const;

    private:
        std::unique_ptr<CommunicateBackend> mBackend;
        Multiplexer mMultiplexer    = Multiplexer::automatic;
        bool        mHasCout        = false;
        bool        mHasCerr        = false;
        ssize_t     mSizeLimit      = -1;
        double      mTimeLimit      = -1;
    };

    /** Sends input and reads all output in one go.

        Same as constructing a Communicator and calling read() once.

        @throw see Communicator::Communicator() and Communicator::read()
    */
    CommunicateOutput communicate(PipeHandle cin, PipeHandle cout,
        PipeHandle cerr, std::optional<std::string> input);
}
