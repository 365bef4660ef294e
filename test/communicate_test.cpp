#include <cxxtest/TestSuite.h>
#include <cerrno>
#include <string>
#include <vector>

#include <duplex.hpp>

#include "FakeChild.hpp"

using duplex::Communicator;
using duplex::CommunicateOutput;
using duplex::Multiplexer;
using duplex::kBadPipeValue;

namespace {
    /** Every multiplexer available on this platform */
    std::vector<Multiplexer> all_multiplexers() {
        if (duplex::kIsWin32)
            return {Multiplexer::threads};
        return {Multiplexer::poll, Multiplexer::threads};
    }

    std::string name(Multiplexer multiplexer) {
        switch (multiplexer) {
        case Multiplexer::automatic:    return "automatic";
        case Multiplexer::poll:         return "poll";
        case Multiplexer::threads:      return "threads";
        }
        return "unknown";
    }

    /** Calls read() until done, gluing together what each call returned */
    CommunicateOutput read_until_done(Communicator& comm, int max_calls,
        int* calls=nullptr) {
        CommunicateOutput total;
        int count = 0;
        while (!comm.done() && count < max_calls) {
            CommunicateOutput output = comm.read();
            ++count;
            if (output.cout) {
                if (!total.cout)
                    total.cout = "";
                *total.cout += *output.cout;
            }
            if (output.cerr) {
                if (!total.cerr)
                    total.cerr = "";
                *total.cerr += *output.cerr;
            }
            if (comm.size_limit() >= 0) {
                std::size_t size = (output.cout? output.cout->size() : 0)
                    + (output.cerr? output.cerr->size() : 0);
                TS_ASSERT_LESS_THAN_EQUALS(size, (std::size_t)comm.size_limit());
            }
        }
        if (calls)
            *calls = count;
        return total;
    }
}

class CommunicateSuite : public CxxTest::TestSuite {
public:
    static CommunicateSuite* createSuite() {
        return new CommunicateSuite();
    }
    static void destroySuite(CommunicateSuite* suite) {
        delete suite;
    }

    void testNoDeadlock() {
        // both directions well over the size of a pipe buffer. The child
        // fills cerr before reading any input.
        std::string input = make_pattern(512*1024);
        std::string noise(100*1024, 'e');
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(true, true, true);
            Communicator comm(child.take_cin(), child.take_cout(),
                child.take_cerr(), input, multiplexer);
            child.start([&] {
                child.write_cerr(noise);
                child.echo();
            });
            CommunicateOutput output = comm.read();
            child.join();

            TS_ASSERT(comm.done());
            TS_ASSERT(output.cout.has_value());
            TS_ASSERT(output.cerr.has_value());
            TS_ASSERT_EQUALS(output.cout->size(), input.size());
            TS_ASSERT(*output.cout == input);
            TS_ASSERT(*output.cerr == noise);
        }
    }

    void testSizeLimitResumes() {
        std::string input = make_pattern(300*1024);
        std::string noise = make_pattern(70*1024);
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(true, true, true);
            Communicator comm(child.take_cin(), child.take_cout(),
                child.take_cerr(), input, multiplexer);
            comm.limit_size(10000);
            child.start([&] {
                child.write_cerr(noise);
                child.echo();
            });
            int calls = 0;
            CommunicateOutput total = read_until_done(comm, 100000, &calls);
            child.join();

            TS_ASSERT(comm.done());
            TS_ASSERT_LESS_THAN((input.size() + noise.size())/10000, (std::size_t)calls);
            TS_ASSERT_EQUALS(total.cout->size(), input.size());
            TS_ASSERT(*total.cout == input);
            TS_ASSERT(*total.cerr == noise);
        }
    }

    void testLeftoverReplayed() {
        // one chunk cut into pieces by the size limit
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            child.write_cout("0123456789");
            child.start([] {});
            child.join();

            Communicator comm(kBadPipeValue, child.take_cout(), kBadPipeValue,
                std::nullopt, multiplexer);
            comm.limit_size(4);
            TS_ASSERT_EQUALS(*comm.read().cout, "0123");
            TS_ASSERT_EQUALS(*comm.read().cout, "4567");
            TS_ASSERT_EQUALS(*comm.read().cout, "89");
            CommunicateOutput rest = read_until_done(comm, 10);
            TS_ASSERT(comm.done());
            if (rest.cout)
                TS_ASSERT_EQUALS(*rest.cout, "");
        }
    }

    void testZeroSizeLimit() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            child.write_cout("abc");
            child.start([] {});
            child.join();

            Communicator comm(kBadPipeValue, child.take_cout(), kBadPipeValue,
                std::nullopt, multiplexer);
            comm.limit_size(0);
            CommunicateOutput output = comm.read();
            TS_ASSERT(output.cout.has_value());
            TS_ASSERT_EQUALS(*output.cout, "");
            TS_ASSERT(!comm.done());

            comm.limit_size(-1);
            TS_ASSERT_EQUALS(*comm.read().cout, "abc");
            TS_ASSERT(comm.done());
        }
    }

    void testTimeoutResumes() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            Communicator comm(kBadPipeValue, child.take_cout(), kBadPipeValue,
                std::nullopt, multiplexer);
            comm.limit_time(0.2);
            child.start([&] {
                duplex::sleep_seconds(1);
                child.write_cout("hello world");
            });

            std::string captured;
            bool did_throw = false;
            duplex::StopWatch timer;
            try {
                comm.read();
            } catch (duplex::TimeoutExpired& error) {
                did_throw = true;
                TS_ASSERT(error.cout.has_value());
                TS_ASSERT(!error.cerr.has_value());
                TS_ASSERT_EQUALS(error.error_code, 0);
                TS_ASSERT_EQUALS(error.timeout, 0.2);
                captured += *error.cout;
            }
            TS_ASSERT(did_throw);
            TS_ASSERT_DELTA(timer.seconds(), 0.2, 0.15);
            TS_ASSERT(!comm.done());

            comm.limit_time(-1);
            CommunicateOutput output = comm.read();
            child.join();
            captured += *output.cout;
            TS_ASSERT_EQUALS(captured, "hello world");
            TS_ASSERT(comm.done());
        }
    }

    void testTimeoutKeepsPartialOutput() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, true);
            Communicator comm(kBadPipeValue, child.take_cout(),
                child.take_cerr(), std::nullopt, multiplexer);
            comm.limit_time(0.5);
            child.start([&] {
                child.write_cout("first");
                duplex::sleep_seconds(1.5);
                child.write_cerr("second");
            });

            std::string cout;
            std::string cerr;
            try {
                comm.read();
                TS_FAIL("expected TimeoutExpired");
            } catch (duplex::TimeoutExpired& error) {
                TS_ASSERT(error.cout.has_value());
                TS_ASSERT(error.cerr.has_value());
                TS_ASSERT_EQUALS(*error.cout, "first");
                TS_ASSERT_EQUALS(*error.cerr, "");
                cout += *error.cout;
                cerr += *error.cerr;
            }

            comm.limit_time(5);
            CommunicateOutput total = read_until_done(comm, 100);
            child.join();
            cout += *total.cout;
            cerr += *total.cerr;
            TS_ASSERT_EQUALS(cout, "first");
            TS_ASSERT_EQUALS(cerr, "second");
        }
    }

    void testTimeoutWithBusyChild() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            duplex::StopWatch timer;
            {
                Communicator comm(kBadPipeValue, child.take_cout(),
                    kBadPipeValue, std::nullopt, multiplexer);
                comm.limit_time(0.2);
                child.start([&] {
                    // never goes quiet until the parent end is gone
                    std::string chunk = make_pattern(4096);
                    while (duplex::pipe_write_all(child.cout(), chunk.data(), chunk.size()) >= 0) {
                    }
                });
                bool did_throw = false;
                try {
                    comm.read();
                } catch (duplex::TimeoutExpired& error) {
                    did_throw = true;
                    TS_ASSERT(error.cout.has_value());
                    TS_ASSERT_LESS_THAN(0u, error.cout->size());
                }
                TS_ASSERT(did_throw);
                TS_ASSERT_LESS_THAN(timer.seconds(), 1.0);
                TS_ASSERT(!comm.done());
            }
            child.join();
        }
    }

    void testNonBlockingHandles() {
        #ifdef _WIN32
        TS_SKIP("non-blocking anonymous pipes behave differently on windows");
        #else
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            {
                // a lone stream takes the blocking path with no limits
                FakeChild child(false, true, false);
                duplex::PipeHandle cout = child.take_cout();
                TS_ASSERT(duplex::pipe_set_blocking(cout, false));
                Communicator comm(kBadPipeValue, cout, kBadPipeValue,
                    std::nullopt, multiplexer);
                child.start([&] {
                    duplex::sleep_seconds(0.1);
                    child.write_cout("hello");
                });
                CommunicateOutput output = comm.read();
                child.join();
                TS_ASSERT(comm.done());
                TS_ASSERT_EQUALS(*output.cout, "hello");
            }
            {
                FakeChild child(false, true, true);
                duplex::PipeHandle cout = child.take_cout();
                duplex::PipeHandle cerr = child.take_cerr();
                TS_ASSERT(duplex::pipe_set_blocking(cout, false));
                TS_ASSERT(duplex::pipe_set_blocking(cerr, false));
                Communicator comm(kBadPipeValue, cout, cerr, std::nullopt,
                    multiplexer);
                comm.limit_time(5);
                child.start([&] {
                    duplex::sleep_seconds(0.1);
                    child.write_cout("hello");
                    duplex::sleep_seconds(0.1);
                    child.write_cerr("world");
                });
                CommunicateOutput total = read_until_done(comm, 100);
                child.join();
                TS_ASSERT(comm.done());
                TS_ASSERT_EQUALS(*total.cout, "hello");
                TS_ASSERT_EQUALS(*total.cerr, "world");
            }
        }
        #endif
    }

    void testStreamPresence() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            {
                FakeChild child(false, true, false);
                Communicator comm(kBadPipeValue, child.take_cout(),
                    kBadPipeValue, std::nullopt, multiplexer);
                comm.limit_size(3);
                child.start([&] { child.write_cout("some output"); });
                while (!comm.done()) {
                    CommunicateOutput output = comm.read();
                    TS_ASSERT(output.cout.has_value());
                    TS_ASSERT(!output.cerr.has_value());
                }
                child.join();
                // done, but still present
                CommunicateOutput output = comm.read();
                TS_ASSERT(output.cout.has_value());
                TS_ASSERT_EQUALS(*output.cout, "");
                TS_ASSERT(!output.cerr.has_value());
            }
            {
                FakeChild child(false, false, true);
                Communicator comm(kBadPipeValue, kBadPipeValue,
                    child.take_cerr(), std::nullopt, multiplexer);
                child.start([&] { child.write_cerr("oops"); });
                CommunicateOutput output = comm.read();
                child.join();
                TS_ASSERT(!output.cout.has_value());
                TS_ASSERT_EQUALS(*output.cerr, "oops");
            }
            {
                FakeChild child(true, false, false);
                std::string received;
                Communicator comm(child.take_cin(), kBadPipeValue,
                    kBadPipeValue, std::string("to the child"), multiplexer);
                child.start([&] { received = duplex::pipe_read_all(child.cin()); });
                CommunicateOutput output = comm.read();
                child.join();
                TS_ASSERT(!output.cout.has_value());
                TS_ASSERT(!output.cerr.has_value());
                TS_ASSERT_EQUALS(received, "to the child");
            }
            {
                Communicator comm(kBadPipeValue, kBadPipeValue, kBadPipeValue,
                    std::nullopt, multiplexer);
                TS_ASSERT(comm.done());
                CommunicateOutput output = comm.read();
                TS_ASSERT(!output.cout.has_value());
                TS_ASSERT(!output.cerr.has_value());
            }
        }
    }

    void testSingleStreamMatchesMultiStream() {
        std::string data = make_pattern(200*1024);
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            std::string single;
            {
                FakeChild child(false, true, false);
                Communicator comm(kBadPipeValue, child.take_cout(),
                    kBadPipeValue, std::nullopt, multiplexer);
                child.start([&] { child.write_cout(data); });
                single = *comm.read().cout;
                child.join();
            }
            std::string multi;
            {
                // same output with an idle cerr forcing the general path
                FakeChild child(false, true, true);
                Communicator comm(kBadPipeValue, child.take_cout(),
                    child.take_cerr(), std::nullopt, multiplexer);
                child.start([&] { child.write_cout(data); });
                CommunicateOutput output = comm.read();
                child.join();
                multi = *output.cout;
                TS_ASSERT_EQUALS(*output.cerr, "");
            }
            TS_ASSERT_EQUALS(single.size(), data.size());
            TS_ASSERT(single == data);
            TS_ASSERT(multi == single);
        }
    }

    void testEmptyInput() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(true, true, false);
            Communicator comm(child.take_cin(), child.take_cout(),
                kBadPipeValue, std::string(), multiplexer);
            child.start([&] {
                std::string input = duplex::pipe_read_all(child.cin());
                child.write_cout("got " + std::to_string(input.size()));
            });
            CommunicateOutput output = comm.read();
            child.join();
            TS_ASSERT_EQUALS(*output.cout, "got 0");
        }
    }

    void testErrorKeepsPartialOutput() {
        #ifdef _WIN32
        TS_SKIP("relies on /dev/null");
        #else
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            child.write_cout("hello");
            child.start([] {});
            child.join();

            // reading from a write only handle fails with EBADF
            duplex::PipeHandle broken = duplex::pipe_file("/dev/null", "w");
            TS_ASSERT_DIFFERS(broken, kBadPipeValue);
            Communicator comm(kBadPipeValue, child.take_cout(), broken,
                std::nullopt, multiplexer);

            std::string cout;
            bool did_throw = false;
            try {
                comm.read();
            } catch (duplex::TimeoutExpired&) {
                TS_FAIL("unexpected TimeoutExpired");
            } catch (duplex::CommunicateError& error) {
                did_throw = true;
                TS_ASSERT_EQUALS(error.error_code, EBADF);
                TS_ASSERT(error.cout.has_value());
                TS_ASSERT(error.cerr.has_value());
                TS_ASSERT_EQUALS(*error.cerr, "");
                if (multiplexer == Multiplexer::poll) {
                    // cout is serviced before cerr in the same pass
                    TS_ASSERT_EQUALS(*error.cout, "hello");
                } else {
                    TS_ASSERT(*error.cout == "" || *error.cout == "hello");
                }
                cout += *error.cout;
            }
            TS_ASSERT(did_throw);

            // the failed stream is finished, the rest carries on
            CommunicateOutput total = read_until_done(comm, 10);
            TS_ASSERT(comm.done());
            if (total.cout)
                cout += *total.cout;
            TS_ASSERT_EQUALS(cout, "hello");
        }
        #endif
    }

    void testWriteToClosedChild() {
        #ifdef _WIN32
        TS_SKIP("posix EPIPE semantics");
        #else
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(true, true, false);
            Communicator comm(child.take_cin(), child.take_cout(),
                kBadPipeValue, make_pattern(1024*1024), multiplexer);
            // child exits without reading its input
            child.start([&] { child.write_cout("bye"); });
            child.join();

            std::string cout;
            try {
                read_until_done(comm, 100);
                TS_FAIL("expected CommunicateError");
            } catch (duplex::CommunicateError& error) {
                TS_ASSERT_EQUALS(error.error_code, EPIPE);
                TS_ASSERT(error.cout.has_value());
                cout += *error.cout;
            }
            CommunicateOutput total = read_until_done(comm, 10);
            if (total.cout)
                cout += *total.cout;
            TS_ASSERT(comm.done());
            TS_ASSERT_EQUALS(cout, "bye");
        }
        #endif
    }

    void testDropWhileChildStillWriting() {
        for (Multiplexer multiplexer : all_multiplexers()) {
            TS_TRACE("multiplexer " + name(multiplexer));
            FakeChild child(false, true, false);
            duplex::StopWatch timer;
            {
                Communicator comm(kBadPipeValue, child.take_cout(),
                    kBadPipeValue, std::nullopt, multiplexer);
                comm.limit_size(100);
                child.start([&] {
                    // stops once the parent end is gone
                    std::string chunk = make_pattern(4096);
                    while (duplex::pipe_write_all(child.cout(), chunk.data(), chunk.size()) >= 0) {
                    }
                });
                TS_ASSERT_EQUALS(comm.read().cout->size(), 100u);
            }
            child.join();
            TS_ASSERT_LESS_THAN(timer.seconds(), 5);
        }
    }

    void testUsageErrors() {
        {
            FakeChild child(true, false, false);
            TS_ASSERT_THROWS(Communicator(child.take_cin(), kBadPipeValue,
                kBadPipeValue, std::nullopt), std::invalid_argument);
        }
        TS_ASSERT_THROWS(Communicator(kBadPipeValue, kBadPipeValue,
            kBadPipeValue, std::string("input")), std::invalid_argument);

        Communicator comm(kBadPipeValue, kBadPipeValue, kBadPipeValue,
            std::nullopt);
        TS_ASSERT_THROWS(comm.limit_size(-2), std::invalid_argument);
        comm.limit_size(-1);
        TS_ASSERT_EQUALS(comm.size_limit(), -1);
        comm.limit_time(-5);
        TS_ASSERT_EQUALS(comm.time_limit(), -1);

        #ifdef _WIN32
        TS_ASSERT_THROWS(Communicator(kBadPipeValue, kBadPipeValue,
            kBadPipeValue, std::nullopt, Multiplexer::poll), std::domain_error);
        #endif
    }

    void testAutomaticMultiplexer() {
        Communicator comm(kBadPipeValue, kBadPipeValue, kBadPipeValue,
            std::nullopt);
        Multiplexer expected = duplex::kIsWin32? Multiplexer::threads : Multiplexer::poll;
        TS_ASSERT_EQUALS(comm.multiplexer(), expected);
    }

    void testMovedCommunicator() {
        FakeChild child(false, true, false);
        Communicator comm(kBadPipeValue, child.take_cout(), kBadPipeValue,
            std::nullopt);
        child.start([&] { child.write_cout("moved"); });
        Communicator other = std::move(comm);
        TS_ASSERT_THROWS(comm.read(), std::domain_error);
        TS_ASSERT_EQUALS(*other.read().cout, "moved");
        child.join();
    }

    void testCommunicateOneShot() {
        FakeChild child(true, true, true);
        duplex::PipeHandle cin = child.take_cin();
        duplex::PipeHandle cout = child.take_cout();
        duplex::PipeHandle cerr = child.take_cerr();
        child.start([&] {
            child.echo();
            child.write_cerr("done");
        });
        CommunicateOutput output = duplex::communicate(cin, cout, cerr,
            std::string("hello world\n"));
        child.join();
        TS_ASSERT_EQUALS(*output.cout, "hello world\n");
        TS_ASSERT_EQUALS(*output.cerr, "done");
    }
};
