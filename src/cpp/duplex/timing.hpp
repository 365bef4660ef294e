#pragma once

namespace duplex {
    /** @return seconds went by from some origin monotonically increasing. */
    double monotonic_seconds();
    /** Sleep for a number of seconds.

        @param seconds  The number of seconds to sleep for.

        @return how many seconds have been slept.
    */
    double sleep_seconds(double seconds);

    class StopWatch {
    public:
        StopWatch() { start(); }

        void start() { mStart = monotonic_seconds(); }
        double seconds() const { return monotonic_seconds() - mStart; }
    private:
        double mStart;
    };

    /** A point in monotonic time after which an operation must give up. A
        default constructed Deadline never expires.
    */
    class Deadline {
    public:
        Deadline(){}
        /** Expires seconds from now. Negative seconds means never. */
        explicit Deadline(double seconds);

        /** @return true if this deadline can expire */
        bool is_set() const { return mAt >= 0; }
        /** @return true if set and the point has passed */
        bool expired() const;
        /** @return seconds left, 0 once expired, -1 if not set */
        double remaining() const;
    private:
        double mAt = -1;
    };
}
