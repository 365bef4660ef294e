#include "PollBackend.hpp"

#ifndef _WIN32
#include <algorithm>
#include <cerrno>

#include "pipe.hpp"
#include "Readiness.hpp"

namespace duplex {
    namespace {
        void close_handle(PipeHandle& handle) {
            if (handle != kBadPipeValue) {
                pipe_close(handle);
                handle = kBadPipeValue;
            }
        }
    }

    PollBackend::PollBackend(PipeHandle cin, PipeHandle cout, PipeHandle cerr,
        std::string input)
        : mCin(cin), mCout(cout), mCerr(cerr), mInput(std::move(input)) {
    }

    PollBackend::~PollBackend() {
        close_handle(mCin);
        close_handle(mCout);
        close_handle(mCerr);
    }

    bool PollBackend::done() const {
        return active_count() == 0;
    }

    int PollBackend::active_count() const {
        return (mCin != kBadPipeValue) + (mCout != kBadPipeValue)
            + (mCerr != kBadPipeValue);
    }

    ReadOutcome PollBackend::read_some(const Deadline& deadline, ssize_t quota,
        std::string& cout, std::string& cerr) {
        std::size_t captured = 0;
        auto read_size = [&]() -> std::size_t {
            if (quota < 0)
                return kReadChunkSize;
            return std::min<std::size_t>(kReadChunkSize, quota - captured);
        };
        bool first_pass = true;
        ReadOutcome outcome;
        while (true) {
            // nothing left to write, the child needs EOF
            if (mCin != kBadPipeValue && mInputPos >= mInput.size())
                close_handle(mCin);
            if (done())
                return {ReadStatus::finished};
            if (quota >= 0 && captured >= (std::size_t)quota)
                return {ReadStatus::size_limit};
            // always give the handles at least one look, even if the
            // deadline has already passed
            if (!first_pass && deadline.expired())
                return {ReadStatus::timeout};
            first_pass = false;

            if (!deadline.is_set() && quota < 0 && active_count() == 1)
                return drain_single(cout, cerr);

            Readiness entries[3] = {
                {mCin,  Interest::write},
                {mCout, Interest::read},
                {mCerr, Interest::read}
            };
            int ready = readiness_poll(entries, 3, deadline.remaining());
            if (ready < 0) {
                if (errno == EINTR)
                    continue;
                return {ReadStatus::error, errno};
            }
            if (ready == 0) {
                if (deadline.is_set())
                    return {ReadStatus::timeout};
                continue;
            }

            if (entries[0].ready() && !write_input(outcome))
                return outcome;
            if (entries[1].ready() && read_size() > 0
                && !read_output(mCout, read_size(), cout, captured, outcome))
                return outcome;
            if (entries[2].ready() && read_size() > 0
                && !read_output(mCerr, read_size(), cerr, captured, outcome))
                return outcome;
        }
    }

    bool PollBackend::write_input(ReadOutcome& outcome) {
        std::size_t size = std::min(kWriteChunkSize, mInput.size() - mInputPos);
        ssize_t transferred = pipe_write(mCin, mInput.data() + mInputPos, size);
        if (transferred < 0) {
            outcome = {ReadStatus::error, pipe_last_error()};
            close_handle(mCin);
            return false;
        }
        mInputPos += transferred;
        if (mInputPos >= mInput.size())
            close_handle(mCin);
        return true;
    }

    bool PollBackend::read_output(PipeHandle& handle, std::size_t size,
        std::string& output, std::size_t& captured, ReadOutcome& outcome) {
        char buffer[kReadChunkSize];
        ssize_t transferred = pipe_read(handle, buffer, size);
        if (transferred < 0) {
            int error = pipe_last_error();
            // readable turned out empty, leave it to the next poll
            if (error == EAGAIN || error == EWOULDBLOCK)
                return true;
            outcome = {ReadStatus::error, error};
            close_handle(handle);
            return false;
        }
        if (transferred == 0) {
            close_handle(handle);
            return true;
        }
        output.append(buffer, transferred);
        captured += transferred;
        return true;
    }

    ReadOutcome PollBackend::drain_single(std::string& cout, std::string& cerr) {
        if (mCin != kBadPipeValue) {
            ssize_t transferred = pipe_write_all(mCin, mInput.data() + mInputPos,
                mInput.size() - mInputPos);
            if (transferred < 0) {
                int error = pipe_last_error();
                close_handle(mCin);
                return {ReadStatus::error, error};
            }
            mInputPos = mInput.size();
            close_handle(mCin);
            return {ReadStatus::finished};
        }

        bool is_cout = mCout != kBadPipeValue;
        PipeHandle& handle = is_cout? mCout : mCerr;
        std::string& output = is_cout? cout : cerr;
        char buffer[kReadChunkSize];
        while (true) {
            ssize_t transferred = pipe_read(handle, buffer, sizeof(buffer));
            if (transferred < 0) {
                int error = pipe_last_error();
                close_handle(handle);
                return {ReadStatus::error, error};
            }
            if (transferred == 0)
                break;
            output.append(buffer, transferred);
        }
        close_handle(handle);
        return {ReadStatus::finished};
    }
}
#endif
