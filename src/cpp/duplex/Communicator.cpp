#include "Communicator.hpp"

#include <cstring>

#include "pipe.hpp"
#include "PollBackend.hpp"
#include "ThreadBackend.hpp"

namespace duplex {
    namespace {
        Multiplexer resolve(Multiplexer multiplexer) {
            if (multiplexer == Multiplexer::automatic)
                return kIsWin32? Multiplexer::threads : Multiplexer::poll;
            if (kIsWin32 && multiplexer == Multiplexer::poll)
                throw std::domain_error("Multiplexer::poll is not available on windows");
            return multiplexer;
        }

        std::string error_string(int error_code) {
#ifdef _WIN32
            LPSTR buffer = nullptr;
            DWORD size = FormatMessageA(
                FORMAT_MESSAGE_ALLOCATE_BUFFER |
                FORMAT_MESSAGE_FROM_SYSTEM |
                FORMAT_MESSAGE_IGNORE_INSERTS,
                NULL,
                (DWORD)error_code,
                MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                (LPSTR)&buffer,
                0, NULL);
            std::string message = size? std::string(buffer, size) : "unknown error";
            LocalFree(buffer);
            return message;
#else
            return std::strerror(error_code);
#endif
        }

        void close_all(PipeHandle cin, PipeHandle cout, PipeHandle cerr) {
            pipe_close(cin);
            pipe_close(cout);
            pipe_close(cerr);
        }

        /*  Both backends rely on blocking handles, a non-blocking one would
            have "no data yet" mistaken for a failure or spin the workers.
        */
        void make_blocking(PipeHandle handle) {
            if (handle == kBadPipeValue || pipe_set_blocking(handle, true))
                return;
            // only named pipes have a mode on windows, files always block
            if (kIsWin32)
                return;
            details::throw_os_error("pipe_set_blocking", pipe_last_error());
        }
    }

    Communicator::Communicator(PipeHandle cin, PipeHandle cout, PipeHandle cerr,
        std::optional<std::string> input, Multiplexer multiplexer) {
        if (cin != kBadPipeValue && !input) {
            close_all(cin, cout, cerr);
            throw std::invalid_argument("Communicator: must provide input to redirected cin");
        }
        if (cin == kBadPipeValue && input) {
            close_all(cin, cout, cerr);
            throw std::invalid_argument("Communicator: cannot provide input to non-redirected cin");
        }
        try {
            mMultiplexer = resolve(multiplexer);
            make_blocking(cin);
            make_blocking(cout);
            make_blocking(cerr);
        } catch (std::exception&) {
            close_all(cin, cout, cerr);
            throw;
        }
        mHasCout = cout != kBadPipeValue;
        mHasCerr = cerr != kBadPipeValue;

        std::string data = input? std::move(*input) : std::string();
#ifndef _WIN32
        if (mMultiplexer == Multiplexer::poll) {
            mBackend = std::make_unique<PollBackend>(cin, cout, cerr, std::move(data));
            return;
        }
#endif
        mBackend = std::make_unique<ThreadBackend>(cin, cout, cerr, std::move(data));
    }

    Communicator::~Communicator() {
    }

    Communicator& Communicator::limit_size(ssize_t bytes) {
        if (bytes < -1)
            throw std::invalid_argument("Communicator::limit_size: bytes must be -1 or more");
        mSizeLimit = bytes;
        return *this;
    }

    Communicator& Communicator::limit_time(double seconds) {
        mTimeLimit = seconds < 0? -1 : seconds;
        return *this;
    }

    bool Communicator::done() const {
        return !mBackend || mBackend->done();
    }

    CommunicateOutput Communicator::read() {
        if (!mBackend)
            throw std::domain_error("Communicator::read: used after move");
        std::string cout;
        std::string cerr;
        Deadline deadline(mTimeLimit);
        ReadOutcome outcome = mBackend->read_some(deadline, mSizeLimit, cout, cerr);

        CommunicateOutput output;
        if (mHasCout)
            output.cout = std::move(cout);
        if (mHasCerr)
            output.cerr = std::move(cerr);

        switch (outcome.status) {
        case ReadStatus::finished:
        case ReadStatus::size_limit:
            break;
        case ReadStatus::timeout: {
            TimeoutExpired timeout("Communicator::read timeout of "
                + std::to_string(mTimeLimit) + " seconds expired");
            timeout.timeout = mTimeLimit;
            timeout.cout = std::move(output.cout);
            timeout.cerr = std::move(output.cerr);
            throw timeout;
        }
        case ReadStatus::error: {
            CommunicateError error("Communicator::read failed: "
                + std::to_string(outcome.error_code) + ": "
                + error_string(outcome.error_code));
            error.error_code = outcome.error_code;
            error.cout = std::move(output.cout);
            error.cerr = std::move(output.cerr);
            throw error;
        }
        }
        return output;
    }

    CommunicateOutput communicate(PipeHandle cin, PipeHandle cout,
        PipeHandle cerr, std::optional<std::string> input) {
        Communicator communicator(cin, cout, cerr, std::move(input));
        return communicator.read();
    }
}
