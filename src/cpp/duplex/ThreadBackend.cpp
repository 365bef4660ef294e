#include "ThreadBackend.hpp"

#include <algorithm>
#include <cerrno>
#include <thread>
#include <vector>

#include "pipe.hpp"

namespace duplex {
    namespace {
        struct AutoClosePipe {
            explicit AutoClosePipe(PipeHandle handle) : mHandle(handle) {}
            ~AutoClosePipe() {
                close();
            }
            AutoClosePipe(const AutoClosePipe&)=delete;
            AutoClosePipe& operator=(const AutoClosePipe&)=delete;

            void close() {
                if (mHandle != kBadPipeValue) {
                    pipe_close(mHandle);
                    mHandle = kBadPipeValue;
                }
            }
            /** Someone else closes it now */
            void release() { mHandle = kBadPipeValue; }
        private:
            PipeHandle mHandle;
        };

        void write_worker(PipeHandle handle, std::string input,
            Sender<StreamMessage> sender) {
            AutoClosePipe autoclose(handle);
            ssize_t transferred = pipe_write_all(handle, input.data(), input.size());
            int error = transferred < 0? pipe_last_error() : 0;
            // close before reporting so the child sees EOF
            autoclose.close();
            // if the send fails the Communicator is gone and no one cares
            if (error)
                sender.send(StreamMessage::make_error(StreamId::cin, error));
            else
                sender.send(StreamMessage::make_eof(StreamId::cin));
        }

        void read_worker(StreamId stream, PipeHandle handle,
            Sender<StreamMessage> sender) {
            AutoClosePipe autoclose(handle);
            std::vector<char> buffer(kReadChunkSize);
            while (true) {
                ssize_t transferred = pipe_read(handle, &buffer[0], buffer.size());
                if (transferred < 0) {
                    int error = pipe_last_error();
                    autoclose.close();
                    sender.send(StreamMessage::make_error(stream, error));
                    return;
                }
                if (transferred == 0) {
                    autoclose.close();
                    sender.send(StreamMessage::make_eof(stream));
                    return;
                }
                std::string chunk(&buffer[0], transferred);
                if (!sender.send(StreamMessage::make_data(stream, std::move(chunk))))
                    return;
            }
        }
    }

    ThreadBackend::ThreadBackend(PipeHandle cin, PipeHandle cout,
        PipeHandle cerr, std::string input) {
        // owned until a worker has taken over
        AutoClosePipe cin_guard(cin);
        AutoClosePipe cout_guard(cout);
        AutoClosePipe cerr_guard(cerr);

        auto channel = make_channel<StreamMessage>(1);
        mReceiver = std::move(channel.second);
        const Sender<StreamMessage>& sender = channel.first;

        if (cin != kBadPipeValue) {
            std::thread(write_worker, cin, std::move(input), sender).detach();
            cin_guard.release();
            mActive |= stream_bit(StreamId::cin);
        }
        if (cout != kBadPipeValue) {
            std::thread(read_worker, StreamId::cout, cout, sender).detach();
            cout_guard.release();
            mActive |= stream_bit(StreamId::cout);
        }
        if (cerr != kBadPipeValue) {
            std::thread(read_worker, StreamId::cerr, cerr, sender).detach();
            cerr_guard.release();
            mActive |= stream_bit(StreamId::cerr);
        }
    }

    ThreadBackend::~ThreadBackend() {
        mReceiver.close();
    }

    bool ThreadBackend::done() const {
        return mActive == 0 && !mLeftover;
    }

    ReadOutcome ThreadBackend::read_some(const Deadline& deadline,
        ssize_t quota, std::string& cout, std::string& cerr) {
        std::size_t captured = 0;
        if (mLeftover) {
            StreamMessage leftover = std::move(*mLeftover);
            mLeftover.reset();
            if (!admit(leftover, quota, captured, cout, cerr))
                return {ReadStatus::size_limit};
        }

        bool first_pass = true;
        while (mActive != 0) {
            if (quota >= 0 && captured >= (std::size_t)quota)
                return {ReadStatus::size_limit};
            // a busy child keeps the channel full, recv alone never times out
            if (!first_pass && deadline.expired())
                return {ReadStatus::timeout};
            first_pass = false;

            StreamMessage message;
            RecvStatus status = mReceiver.recv(message, deadline.remaining());
            if (status == RecvStatus::timeout)
                return {ReadStatus::timeout};
            if (status == RecvStatus::disconnected) {
                // a worker died without saying goodbye
                mActive = 0;
                return {ReadStatus::error, EPIPE};
            }

            switch (message.kind) {
            case StreamMessage::Kind::data:
                if (!admit(message, quota, captured, cout, cerr))
                    return {ReadStatus::size_limit};
                break;
            case StreamMessage::Kind::eof:
                mActive &= ~stream_bit(message.stream);
                break;
            case StreamMessage::Kind::error:
                mActive &= ~stream_bit(message.stream);
                return {ReadStatus::error, message.error_code};
            }
        }
        return {ReadStatus::finished};
    }

    bool ThreadBackend::admit(StreamMessage& message, ssize_t quota,
        std::size_t& captured, std::string& cout, std::string& cerr) {
        std::string& output = message.stream == StreamId::cerr? cerr : cout;
        std::size_t room = message.data.size();
        if (quota >= 0)
            room = std::min(room, (std::size_t)quota - captured);
        output.append(message.data, 0, room);
        captured += room;
        if (room == message.data.size())
            return true;
        message.data.erase(0, room);
        mLeftover = std::move(message);
        return false;
    }
}
