#include "Readiness.hpp"

#ifndef _WIN32
#include <cmath>
#include <poll.h>

namespace duplex {
    bool Readiness::ready() const {
        if (handle == kBadPipeValue)
            return false;
        short wanted = interest == Interest::read? POLLIN : POLLOUT;
        return (revents & (wanted | POLLHUP | POLLERR | POLLNVAL)) != 0;
    }

    int readiness_poll(Readiness* entries, int count, double seconds) {
        constexpr int kMaxEntries = 3;
        if (count < 0 || count > kMaxEntries)
            throw std::invalid_argument("readiness_poll: too many entries");
        pollfd fds[kMaxEntries] = {};
        for (int i = 0; i < count; ++i) {
            // poll() skips negative descriptors
            fds[i].fd = entries[i].handle;
            fds[i].events = entries[i].interest == Interest::read? POLLIN : POLLOUT;
            entries[i].revents = 0;
        }

        int ms = (seconds < 0) ? -1 : (int)std::ceil(seconds*1000.0);
        int ret = poll(fds, count, ms);
        if (ret <= 0)
            return ret;
        for (int i = 0; i < count; ++i)
            entries[i].revents = fds[i].revents;
        return ret;
    }
}
#endif
