#pragma once

#include <string>
#include <utility>

#include "basic_types.hpp"

namespace duplex {
    /*  The pipe API stays C-like. A Communicator takes ownership of the
        handles given to it, so most code only needs PipePair while setting
        up and never touches a raw handle again.
    */
    struct PipePair {
        PipePair(){};
        PipePair(PipeHandle input, PipeHandle output) : input(input), output(output) {}
        ~PipePair(){ close(); }
        // No copy, move only
        PipePair            (const PipePair&)=delete;
        PipePair& operator= (const PipePair&)=delete;
        PipePair            (PipePair&& other) { *this = std::move(other); }
        PipePair& operator= (PipePair&& other);
        /*  const as outside code shouldn't modify these. disown, close*, and
            move semantics overwrite these values.
        */
        /** The read end */
        const PipeHandle input    = kBadPipeValue;
        /** The write end */
        const PipeHandle output   = kBadPipeValue;

        /** Disowns the input & output end */
        void disown() {
            const_cast<PipeHandle&>(input) = const_cast<PipeHandle&>(output) = kBadPipeValue;
        }
        /** Disowns the input end and returns it. Caller now owns it. */
        PipeHandle release_input() {
            PipeHandle handle = input;
            const_cast<PipeHandle&>(input) = kBadPipeValue;
            return handle;
        }
        /** Disowns the output end and returns it. Caller now owns it. */
        PipeHandle release_output() {
            PipeHandle handle = output;
            const_cast<PipeHandle&>(output) = kBadPipeValue;
            return handle;
        }

        void close();
        void close_input();
        void close_output();
        explicit operator bool() const noexcept {
            return input != output;
        }
    };

    /** Closes a pipe handle.
        @param handle   The handle to close.
        @returns true on success
    */
    bool pipe_close(PipeHandle handle);

    /** Creates a pair of pipes for input/output

        @param inheritable  if true subprocesses will inherit the pipe. Leave
                            this false, if the child inherits the end you hold
                            it will never see EOF after you close yours.

        @throw OSError if system call fails.

        @return pipe pair.
    */
    PipePair pipe_create(bool inheritable = false);

    /** Set the pipe to be inheritable or not for subprocess.

        @throw OSError if system call fails.
        @throw std::invalid_argument if handle is kBadPipeValue

        @param inheritable if true handle will be inherited in subprocess.
    */
    void pipe_set_inheritable(PipeHandle handle, bool inheritable);

    /**
        @returns    -1 on error, pipe_last_error() has the reason. A
                    non-blocking pipe with no data yet is an error too
                    (EAGAIN or ERROR_NO_DATA). 0 only on EOF.
    */
    ssize_t pipe_read(PipeHandle, void* buffer, size_t size);
    /**
        @returns    -1 on error, pipe_last_error() has the reason. 0 if a
                    non-blocking pipe is full.
    */
    ssize_t pipe_write(PipeHandle, const void* buffer, size_t size);

    /** Writes all of buffer, blocking as needed.

        @returns    size on success, -1 on error. pipe_last_error() has the
                    reason.
    */
    ssize_t pipe_write_all(PipeHandle, const void* buffer, size_t size);

    /** @return errno on posix, GetLastError() on windows */
    int pipe_last_error();

    /** Sets the blocking bit.

        The handle state is first queried as to only change the blocking bit.

        @param should_block
            If false then pipe_read/write will exit early if there is no data.

        @returns true on success
    */
    bool pipe_set_blocking(PipeHandle, bool should_block);

    /** Read contents of handle until no more data is available.

        If the pipe is non-blocking this will end prematurely.

        @return all data read from pipe as a string object. This works fine
                with binary data.
    */
    std::string pipe_read_all(PipeHandle handle);

    /** Opens a file and returns the handle.

        You must call pipe_close() on the returned handle. When passed to a
        Communicator, pipe_close should not be called as ownership will be
        taken.

        @param filename
            The file path
        @param mode
            The mode as from fopen. Always binary mode.
            r - read only, will fail if file doesn't exist
            w - write only and will create or truncate the file
            + - allow read/write

        @returns the handle to the opened file, or kBadPipeValue on error
    */
    PipeHandle pipe_file(const char* filename, const char* mode);
}
