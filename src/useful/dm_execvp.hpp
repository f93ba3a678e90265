/*********************************************************************************\
 * dm_execvp.hpp - fork / execvp a program and read its output as an istream
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <sys/types.h>
#include <errno.h>
#include <string.h>

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>

namespace doorman {

/* FdBuf - create a streambuf from a file descriptor */
class FdBuf : public std::streambuf {
public:
    FdBuf(int fd_) : fd(fd_) {
        if (fd_ < 0) {
            throw std::invalid_argument("Invalid file descriptor");
        }
    }

    FdBuf() : fd(-1) {}

    virtual ~FdBuf() {
        if (fd >= 0) {
            close(fd);
        }
    }

protected:
    virtual int underflow() {
        if (fd < 0) { throw std::runtime_error("File descriptor not set"); }

        while (true) {
            ssize_t numBytesRead = read(fd, &readCh, 1);
            if (numBytesRead == 0) {
                return EOF;
            } else if (numBytesRead < 0) {
                if ((errno == EAGAIN) || (errno == EINTR)) {
                    continue;
                } else {
                    throw std::runtime_error("read failed: " + std::string{strerror(errno)});
                }
            } else {
                break;
            }
        }

        setg(&readCh, &readCh, &readCh + 1);
        return traits_type::to_int_type(readCh);
    }

private:
    char readCh;
protected:
    const int fd;
};

class FdPair {
protected:
    enum Ends { ReadEnd = 0, WriteEnd = 1 };
    bool readOpened = false;
    bool writeOpened = false;

    int fds[2];

public:
    static const int stdin = 0;
    static const int stdout = 1;
    static const int stderr = 2;

    FdPair()
        : readOpened{false}
        , writeOpened{false}
        , fds{-1, -1}
    {}

    ~FdPair() {
        if (readOpened) {
            close(fds[ReadEnd]);
        }

        if (writeOpened) {
            close(fds[WriteEnd]);
        }
    }

    void closeRead() {
        if (!readOpened) {
            throw std::logic_error("Already closed read end");
        }

        close(fds[ReadEnd]);
        readOpened = false;
    }

    void closeWrite() {
        if (!writeOpened) {
            throw std::logic_error("Already closed write end");
        }

        close(fds[WriteEnd]);
        writeOpened = false;
    }

    // Hand the read end over to another owner (e.g. FdBuf)
    int releaseRead() {
        readOpened = false;
        return fds[ReadEnd];
    }

    int getReadFd() const { return fds[ReadEnd]; }
    int getWriteFd() const { return fds[WriteEnd]; }

    /* Pipe - create and track closed ends of pipe */
    void pipe(int flags = 0)
    {
        if (readOpened || writeOpened) {
            throw std::runtime_error("read or write pipe already opened");
        }

        if (::pipe2(fds, flags)) {
            throw std::runtime_error("Pipe error");
        }

        readOpened = true;
        writeOpened = true;
    }
};

struct Pipe : public FdPair
{
    Pipe(int flags = 0)
        : FdPair{}
    {
        pipe(flags);
    }
};

namespace {
    // Wait for a child to exit and translate its status, retrying on signal interruption.
    // A child killed by a signal reports 128 + signal, like a shell would.
    static inline int waitExitStatus(pid_t child)
    {
        int status = 0;
        while (true) {
            auto const rc = ::waitpid(child, &status, 0);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                } else {
                    throw std::runtime_error("waitpid() on " + std::to_string(child) + " failed!");
                }
            } else if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            } else {
                return WEXITSTATUS(status);
            }
        }
    }
}

/* Execvp - fork / execvp a program and read its output as an istream */
class Execvp {
public:
   enum class stderr : int
       { Ignore = 0
       , Pipe = 1
       , Inherit = 2
   };

private:
    Pipe p;
    FdBuf pipeInBuf;
    std::istream pipein;
    pid_t child;
    bool waited;
    int exitStatus;

public:
    Execvp(const char *binaryName, char* const* argv, stderr stderr_behavior)
        : pipeInBuf(p.getReadFd())
        , pipein(&pipeInBuf)
        , child(fork())
        , waited{false}
        , exitStatus{-1}
    {
        if (child < 0) {
            throw std::runtime_error(std::string("fork() for ") + binaryName + " failed!");
        } else if (child == 0) { // child side of fork
            /* prepare the output pipe */
            p.closeRead();
            dup2(p.getWriteFd(), Pipe::stdout);
            if (stderr_behavior == stderr::Ignore) {
                dup2(open("/dev/null", O_WRONLY), Pipe::stderr);
            } else if (stderr_behavior == stderr::Pipe) {
                dup2(p.getWriteFd(), Pipe::stderr);
            }
            p.closeWrite();

            execvp(binaryName, argv);
            _exit(127);
        }

        /* FdBuf owns the read end from here on */
        p.releaseRead();

        /* create istream from output pipe */
        p.closeWrite();
    }

    ~Execvp() {
        // reap the child so it does not linger as a zombie
        if (!waited && (child > 0)) {
            try {
                waitExitStatus(child);
            } catch (std::exception const&) {
                // already reaped elsewhere
            }
        }
    }

    Execvp(Execvp const&) = delete;
    Execvp& operator=(Execvp const&) = delete;

    int getExitStatus() {
        if (!waited) {
            exitStatus = waitExitStatus(child);
            waited = true;
        }
        return exitStatus;
    }

    std::istream& stream() { return pipein; }

    // read the rest of the output
    std::string readAll() {
        return std::string{std::istreambuf_iterator<char>{pipein}, std::istreambuf_iterator<char>{}};
    }
};

/* Spawn - fork / execvp a program attached to the caller's terminal */
class Spawn {
private:
    pid_t child;
    bool waited;
    int exitStatus;

public:
    Spawn(const char *binaryName, char* const* argv)
        : child(fork())
        , waited{false}
        , exitStatus{-1}
    {
        if (child < 0) {
            throw std::runtime_error(std::string("fork() for ") + binaryName + " failed!");
        } else if (child == 0) { // child side of fork
            execvp(binaryName, argv);
            _exit(127);
        }
    }

    ~Spawn() {
        if (!waited && (child > 0)) {
            try {
                waitExitStatus(child);
            } catch (std::exception const&) {
                // already reaped elsewhere
            }
        }
    }

    Spawn(Spawn const&) = delete;
    Spawn& operator=(Spawn const&) = delete;

    pid_t getPid() const { return child; }

    int wait() {
        if (!waited) {
            exitStatus = waitExitStatus(child);
            waited = true;
        }
        return exitStatus;
    }
};

} /* namespace doorman */
