#pragma once

#include <optional>

#include "Channel.hpp"
#include "CommunicateBackend.hpp"
#include "StreamMessage.hpp"

namespace duplex {
    /** Backend for platforms where pipes can't be poll()ed.

        Every stream gets its own detached worker thread doing plain blocking
        I/O. Workers report through a channel with room for 1 message so a
        fast producer waits for read_some() to catch up. Only the thread
        calling read_some() touches the captured output.
    */
    class ThreadBackend : public CommunicateBackend {
    public:
        /** Takes ownership of the handles, any of which may be kBadPipeValue.
            The workers start right away.
        */
        ThreadBackend(PipeHandle cin, PipeHandle cout, PipeHandle cerr,
            std::string input);
        ThreadBackend(const ThreadBackend&)=delete;
        ThreadBackend& operator=(const ThreadBackend&)=delete;
        /** Disconnects from the workers. They exit on their next send, or
            once their pipe reports EOF or an error.
        */
        ~ThreadBackend();

        ReadOutcome read_some(const Deadline& deadline, ssize_t quota,
            std::string& cout, std::string& cerr) override;
        bool done() const override;

    private:
        /** Appends what fits in the quota, stashes the rest in mLeftover.

            @return false if the quota cut the message short.
        */
        bool admit(StreamMessage& message, ssize_t quota,
            std::size_t& captured, std::string& cout, std::string& cerr);

        Receiver<StreamMessage>         mReceiver;
        /** stream_bit() of every stream that hasn't finished */
        unsigned                        mActive = 0;
        /** data cut off by the quota, goes out first on the next call */
        std::optional<StreamMessage>    mLeftover;
    };
}
