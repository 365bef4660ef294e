#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace duplex {
    /** Result of Receiver::recv() */
    enum class RecvStatus : int {
        ok,             ///< a value was received
        timeout,        ///< nothing arrived in time, try again later
        disconnected    ///< empty and every Sender is gone
    };

    /** @cond PRIVATE */
    namespace details {
        template<typename T>
        struct ChannelState {
            explicit ChannelState(std::size_t capacity) : capacity(capacity) {}

            std::mutex              mutex;
            std::condition_variable not_empty;
            std::condition_variable not_full;
            std::deque<T>           queue;
            std::size_t             capacity;
            int                     senders         = 0;
            bool                    receiver_alive  = true;
        };
    }
    /** @endcond */

    /** Sending end of a channel. Copy it to have more producers. */
    template<typename T>
    class Sender {
    public:
        Sender(){}
        explicit Sender(std::shared_ptr<details::ChannelState<T>> state)
            : mState(std::move(state)) { retain(); }
        Sender(const Sender& other) : mState(other.mState) { retain(); }
        Sender(Sender&& other) : mState(std::move(other.mState)) {}
        Sender& operator=(Sender other) {
            release();
            mState = std::move(other.mState);
            return *this;
        }
        ~Sender() { release(); }

        /** Blocks while the channel is full.

            @returns false if the receiver is gone, value is dropped.
        */
        bool send(T value) {
            if (!mState)
                return false;
            std::unique_lock<std::mutex> lock(mState->mutex);
            mState->not_full.wait(lock, [this] {
                return !mState->receiver_alive
                    || mState->queue.size() < mState->capacity;
            });
            if (!mState->receiver_alive)
                return false;
            mState->queue.push_back(std::move(value));
            mState->not_empty.notify_one();
            return true;
        }

    private:
        void retain() {
            if (!mState)
                return;
            std::lock_guard<std::mutex> lock(mState->mutex);
            ++mState->senders;
        }
        void release() {
            if (!mState)
                return;
            {
                std::lock_guard<std::mutex> lock(mState->mutex);
                if (--mState->senders == 0)
                    mState->not_empty.notify_all();
            }
            mState.reset();
        }
        std::shared_ptr<details::ChannelState<T>> mState;
    };

    /** Receiving end of a channel. There is only ever one, move only.

        Destroying it wakes every blocked Sender and makes all sends fail.
    */
    template<typename T>
    class Receiver {
    public:
        Receiver(){}
        explicit Receiver(std::shared_ptr<details::ChannelState<T>> state)
            : mState(std::move(state)) {}
        Receiver(const Receiver&)=delete;
        Receiver& operator=(const Receiver&)=delete;
        Receiver(Receiver&& other) : mState(std::move(other.mState)) {}
        Receiver& operator=(Receiver&& other) {
            close();
            mState = std::move(other.mState);
            return *this;
        }
        ~Receiver() { close(); }

        /** Waits for a value.

            @param value    set on RecvStatus::ok
            @param seconds  how long to wait, -1 to wait forever.
        */
        RecvStatus recv(T& value, double seconds=-1) {
            if (!mState)
                return RecvStatus::disconnected;
            std::unique_lock<std::mutex> lock(mState->mutex);
            auto ready = [this] {
                return !mState->queue.empty() || mState->senders == 0;
            };
            if (seconds < 0) {
                mState->not_empty.wait(lock, ready);
            } else {
                std::chrono::duration<double> duration(seconds);
                auto timeout = std::chrono::duration_cast<
                    std::chrono::steady_clock::duration>(duration);
                if (!mState->not_empty.wait_for(lock, timeout, ready))
                    return RecvStatus::timeout;
            }
            if (mState->queue.empty())
                return RecvStatus::disconnected;
            value = std::move(mState->queue.front());
            mState->queue.pop_front();
            mState->not_full.notify_one();
            return RecvStatus::ok;
        }

        /** Disconnects. Queued values are dropped, senders fail from now on. */
        void close() {
            if (!mState)
                return;
            {
                std::lock_guard<std::mutex> lock(mState->mutex);
                mState->receiver_alive = false;
                mState->queue.clear();
                mState->not_full.notify_all();
            }
            mState.reset();
        }
    private:
        std::shared_ptr<details::ChannelState<T>> mState;
    };

    /** Creates a bounded channel.

        @param capacity     values that can be queued before send() blocks.
                            Must be at least 1.
    */
    template<typename T>
    std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity=1) {
        if (capacity == 0)
            capacity = 1;
        auto state = std::make_shared<details::ChannelState<T>>(capacity);
        return {Sender<T>(state), Receiver<T>(state)};
    }
}
