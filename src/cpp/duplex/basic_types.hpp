#pragma once
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>


// stdout, stderr, stdin are macros. So instead of stdout,...
// we use cin, cout, cerr as variable names


namespace duplex {
    // ssize_t is not a standard type and not supported in MSVC
    typedef intptr_t ssize_t;

    #ifdef _WIN32
    /** True if on windows platform. This constant is useful so you can use
        regular if statements instead of ifdefs and have both branches compile
        therebye reducing chance of compiler error on a different platform.
    */
    constexpr bool kIsWin32 = true;
    #else
    constexpr bool kIsWin32 = false;
    #endif

#ifndef _WIN32
    typedef int PipeHandle;
    // to please windows we can't have this be a constexpr and be standard c++
    /** The value representing an invalid pipe */
    const PipeHandle kBadPipeValue = (PipeHandle)-1;
#else
    typedef HANDLE PipeHandle;
    const PipeHandle kBadPipeValue = INVALID_HANDLE_VALUE;
#endif

    /** Size of each write to the child's stdin. Must stay below the pipe
        buffer size, a larger write on a blocking pipe can stall even though
        poll reported the pipe writable.
    */
    constexpr std::size_t kWriteChunkSize   = 4096;
    /** Most bytes taken from cout/cerr per read call. */
    constexpr std::size_t kReadChunkSize    = 4096;

    /** Identifies one of the three standard streams of the child. */
    enum class StreamId : int {
        cin     = 0,
        cout    = 1,
        cerr    = 2
    };

    /** Bit used for stream in an active stream mask */
    constexpr unsigned stream_bit(StreamId stream) {
        return 1u << static_cast<int>(stream);
    }

    /** How the Communicator interleaves the streams. */
    enum class Multiplexer : int {
        automatic,  ///< poll on posix, threads on windows
        poll,       ///< single threaded poll() loop. Not available on windows.
        threads     ///< a worker thread per stream feeding a channel
    };

    struct DuplexError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct OSError : DuplexError {
        using DuplexError::DuplexError;
    };

    /** A read() on a Communicator failed.

        Whatever was captured before the failure is kept here. A stream
        that wasn't requested is std::nullopt just like in a successful
        read.
    */
    struct CommunicateError : DuplexError {
        using DuplexError::DuplexError;
        /** Captured stdout before the failure */
        std::optional<std::string> cout;
        /** Captured stderr before the failure */
        std::optional<std::string> cerr;
        /** errno on posix, GetLastError() on windows. 0 for timeouts. */
        int error_code = 0;
    };

    /** The time limit of a read() expired. Calling read() again continues
        where this one stopped.
    */
    struct TimeoutExpired : CommunicateError {
        using CommunicateError::CommunicateError;
        /** The time limit in seconds that was exceeded */
        double timeout = -1;
    };

    /** Output of a single read() */
    struct CommunicateOutput {
        /** Newly captured stdout, nullopt if stdout was not requested */
        std::optional<std::string> cout;
        /** Newly captured stderr, nullopt if stderr was not requested */
        std::optional<std::string> cerr;
    };

    namespace details {
        void throw_os_error(const char* function, int errno_code);
    }
}
