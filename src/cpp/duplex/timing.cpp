#include "timing.hpp"

#include <chrono>
#include <thread>

namespace duplex {
    double monotonic_seconds() {
        // thread safe initialization, the worker threads call this too
        static const std::chrono::steady_clock::time_point begin =
            std::chrono::steady_clock::now();
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        std::chrono::duration<double> duration = now - begin;
        return duration.count();
    }

    double sleep_seconds(double seconds) {
        StopWatch watch;
        std::chrono::duration<double> duration(seconds);
        std::this_thread::sleep_for(duration);
        return watch.seconds();
    }

    Deadline::Deadline(double seconds) {
        if (seconds >= 0)
            mAt = monotonic_seconds() + seconds;
    }

    bool Deadline::expired() const {
        return is_set() && monotonic_seconds() >= mAt;
    }

    double Deadline::remaining() const {
        if (!is_set())
            return -1;
        double left = mAt - monotonic_seconds();
        return left > 0? left : 0;
    }
}
