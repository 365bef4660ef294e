#include "pipe.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#endif

#include "timing.hpp"

namespace duplex {
    namespace details {
        void throw_os_error(const char* function, int errno_code) {
            if (errno_code == 0)
                return;
            std::string message = function;
            message += " failed: " + std::to_string(errno_code) + ": ";
            message += std::strerror(errno_code);
            throw OSError(message);
        }
    }

    PipePair& PipePair::operator=(PipePair&& other) {
        close();
        const_cast<PipeHandle&>(input)   = other.input;
        const_cast<PipeHandle&>(output)  = other.output;
        other.disown();
        return *this;
    }
    void PipePair::close() {
        if (input != kBadPipeValue)
            pipe_close(input);
        if (output != kBadPipeValue)
            pipe_close(output);
        disown();
    }
    void PipePair::close_input() {
        if (input != kBadPipeValue) {
            pipe_close(input);
            const_cast<PipeHandle&>(input) = kBadPipeValue;
        }
    }
    void PipePair::close_output() {
        if (output != kBadPipeValue) {
            pipe_close(output);
            const_cast<PipeHandle&>(output) = kBadPipeValue;
        }
    }

    ssize_t pipe_write_all(PipeHandle handle, const void* buffer, size_t size) {
        const char* data = static_cast<const char*>(buffer);
        std::size_t pos = 0;
        while (pos < size) {
            ssize_t transferred = pipe_write(handle, data + pos, size - pos);
            if (transferred < 0)
                return -1;
            // non-blocking pipe is full, wait a bit
            if (transferred == 0) {
                sleep_seconds(0.0001);
                continue;
            }
            pos += transferred;
        }
        return size;
    }

#ifdef _WIN32
    int pipe_last_error() {
        return (int)GetLastError();
    }

    void pipe_set_inheritable(PipeHandle handle, bool inheritable) {
        if (handle == kBadPipeValue)
            throw std::invalid_argument("pipe_set_inheritable: handle is invalid");

        bool success = !!SetHandleInformation(handle, HANDLE_FLAG_INHERIT, inheritable? HANDLE_FLAG_INHERIT : 0);
        if (!success) {
            throw OSError("SetHandleInformation failed: " + std::to_string(GetLastError()));
        }
    }
    bool pipe_close(PipeHandle handle) {
        if (handle == kBadPipeValue)
            return false;
        return !!CloseHandle(handle);
    }
    PipePair pipe_create(bool inheritable) {
        SECURITY_ATTRIBUTES security = {0};
        security.nLength = sizeof(security);
        security.bInheritHandle = inheritable;
        PipeHandle input, output;
        bool result = CreatePipe(&input, &output, &security, 0);
        if (!result) {
            throw OSError("CreatePipe failed: " + std::to_string(GetLastError()));
        }
        return {input, output};
    }
    ssize_t pipe_read(PipeHandle handle, void* buffer, std::size_t size) {
        DWORD bread = 0;
        bool result = ReadFile(handle, buffer, (DWORD)size, &bread, nullptr);
        if (result)
            return bread;
        // writer closed its end, this is how windows reports EOF on pipes.
        // ERROR_NO_DATA is a PIPE_NOWAIT pipe with nothing in it yet.
        if (GetLastError() == ERROR_BROKEN_PIPE)
            return 0;
        return -1;
    }

    ssize_t pipe_write(PipeHandle handle, const void* buffer, size_t size) {
        DWORD written = 0;
        bool result = WriteFile(handle, buffer, (DWORD)size, &written, nullptr);
        if (result)
            return written;
        return -1;
    }

    bool pipe_set_blocking(PipeHandle handle, bool should_block) {
        DWORD state = 0;
        bool success = !!GetNamedPipeHandleStateA(
            handle,
            &state,
            nullptr,
            nullptr,
            nullptr,
            nullptr, 0
        );
        if (!success)
            return false;
        if (should_block) {
            state &= ~PIPE_NOWAIT;
        } else {
            state |= PIPE_NOWAIT;
        }
        success = !!SetNamedPipeHandleState(
            handle,
            &state,
            nullptr, nullptr
        );
        return success;
    }

    PipeHandle pipe_file(const char* filename, const char* mode) {
        DWORD access = 0;
        DWORD disposition = OPEN_EXISTING;
        for (const char* c = mode; *c; ++c) {
            switch (*c) {
            case 'r': access |= GENERIC_READ; break;
            case 'w':
                access |= GENERIC_WRITE;
                disposition = CREATE_ALWAYS;
                break;
            case 'a':
                access |= FILE_APPEND_DATA;
                disposition = OPEN_ALWAYS;
                break;
            case '+': access |= GENERIC_READ | GENERIC_WRITE; break;
            }
        }
        SECURITY_ATTRIBUTES security = {0};
        security.nLength = sizeof(security);
        security.bInheritHandle = false;
        HANDLE handle = CreateFileA(filename, access,
            FILE_SHARE_READ | FILE_SHARE_WRITE, &security, disposition,
            FILE_ATTRIBUTE_NORMAL, nullptr);
        return handle;
    }
#else
    int pipe_last_error() {
        return errno;
    }

    void pipe_set_inheritable(PipeHandle handle, bool inherits) {
        if (handle == kBadPipeValue)
            throw std::invalid_argument("pipe_set_inheritable: handle is invalid");
        int flags = fcntl(handle, F_GETFD);
        if (flags < 0)
            details::throw_os_error("fcntl", errno);
        if (inherits)
            flags &= ~FD_CLOEXEC;
        else
            flags |= FD_CLOEXEC;
        int result = fcntl(handle, F_SETFD, flags);
        if (result < 0)
            details::throw_os_error("fcntl", errno);
    }
    bool pipe_close(PipeHandle handle) {
        if (handle == kBadPipeValue)
            return false;
        return ::close(handle) == 0;
    }

    PipePair pipe_create(bool inheritable) {
        int fd[2];
        bool success = !::pipe(fd);
        if (!success) {
            details::throw_os_error("pipe", errno);
            return {};
        }
        PipePair pair(fd[0], fd[1]);
        if (!inheritable) {
            pipe_set_inheritable(pair.input, false);
            pipe_set_inheritable(pair.output, false);
        }
        return pair;
    }

    ssize_t pipe_read(PipeHandle handle, void* buffer, size_t size) {
        while (true) {
            ssize_t transferred = ::read(handle, buffer, size);
            // EAGAIN stays an error, 0 is reserved for EOF
            if (transferred < 0 && errno == EINTR)
                continue;
            return transferred;
        }
    }

    ssize_t pipe_write(PipeHandle handle, const void* buffer, size_t size) {
        while (true) {
            ssize_t transferred = ::write(handle, buffer, size);
            if (transferred < 0) {
                if (errno == EINTR)
                    continue;
                // this is fine, not really an error, client should try again
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return 0;
            }
            return transferred;
        }
    }

    bool pipe_set_blocking(PipeHandle handle, bool should_block) {
        int state = fcntl(handle, F_GETFL);
        if (state < 0)
            return false;
        if (should_block) {
            state &= ~O_NONBLOCK;
        } else {
            state |= O_NONBLOCK;
        }
        return fcntl(handle, F_SETFL, state) == 0;
    }

    PipeHandle pipe_file(const char* filename, const char* mode) {
        int flags = 0;
        bool read = false;
        bool write = false;
        for (const char* c = mode; *c; ++c) {
            switch (*c) {
            case 'r': read = true; break;
            case 'w':
                write = true;
                flags |= O_CREAT | O_TRUNC;
                break;
            case 'a':
                write = true;
                flags |= O_CREAT | O_APPEND;
                break;
            case '+': read = write = true; break;
            }
        }
        if (read && write)
            flags |= O_RDWR;
        else if (write)
            flags |= O_WRONLY;
        else
            flags |= O_RDONLY;
        flags |= O_CLOEXEC;
        int handle = ::open(filename, flags, 0666);
        if (handle < 0)
            return kBadPipeValue;
        return handle;
    }
#endif

    std::string pipe_read_all(PipeHandle handle) {
        if (handle == kBadPipeValue)
            return {};
        constexpr int buf_size = 2048;
        uint8_t buf[buf_size];
        std::string result;
        while(true) {
            ssize_t transfered = pipe_read(handle, buf, buf_size);
            if(transfered > 0) {
                result.insert(result.end(), &buf[0], &buf[transfered]);
            } else {
                break;
            }
        }
        return result;
    }
}
