#pragma once

#include "CommunicateBackend.hpp"

#ifndef _WIN32
namespace duplex {
    /** Single threaded backend. poll()s cin for writing and cout/cerr for
        reading and only touches a handle once poll reports it ready.
    */
    class PollBackend : public CommunicateBackend {
    public:
        /** Takes ownership of the handles, any of which may be kBadPipeValue */
        PollBackend(PipeHandle cin, PipeHandle cout, PipeHandle cerr,
            std::string input);
        PollBackend(const PollBackend&)=delete;
        PollBackend& operator=(const PollBackend&)=delete;
        ~PollBackend();

        ReadOutcome read_some(const Deadline& deadline, ssize_t quota,
            std::string& cout, std::string& cerr) override;
        bool done() const override;

    private:
        int active_count() const;
        /** No deadline and no quota with only 1 handle left. Nothing can
            deadlock so just block on it until it's finished.
        */
        ReadOutcome drain_single(std::string& cout, std::string& cerr);
        bool write_input(ReadOutcome& outcome);
        bool read_output(PipeHandle& handle, std::size_t size,
            std::string& output, std::size_t& captured, ReadOutcome& outcome);

        PipeHandle  mCin    = kBadPipeValue;
        PipeHandle  mCout   = kBadPipeValue;
        PipeHandle  mCerr   = kBadPipeValue;

        std::string mInput;
        /** How much of mInput has been written */
        std::size_t mInputPos = 0;
    };
}
#endif
