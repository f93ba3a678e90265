/******************************************************************************\
 * dm_wrappers.hpp - A header file for utility wrappers. This is for helper
 *                   wrappers to C-style allocation and error handling routines.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include "doorman_defs.h"

#include <cstring>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>

#include <fcntl.h>
#include <unistd.h>

namespace doorman {

// there is an std::make_unique<T> which constructs a unique_ptr of type T from its arguments.
// however, there is no equivalent that accepts a custom destructor function. normally, one would
// have to explicitly provide the types of T and its destructor function:
//     std::unique_ptr<T, decltype(&destructor)>{new T{}, destructor}
// this is a helper function to perform this deduction:
//     take_pointer_ownership(new T{}, destructor)
// for example:
//     auto const cstr = take_pointer_ownership(strdup(...), std::free);
template <typename T, typename Destr>
inline static auto
take_pointer_ownership(T*&& expiring, Destr&& destructor) -> std::unique_ptr<T, decltype(&destructor)>
{
    // type of Destr&& is deduced at the same time as Destr -> universal reference
    static_assert(!std::is_rvalue_reference<decltype(destructor)>::value);

    // type of T is deduced from T* first, then parameter as T*&& -> rvalue reference
    static_assert(std::is_rvalue_reference<decltype(expiring)>::value);

    return std::unique_ptr<T, decltype(&destructor)>
    { std::move(expiring) // then we take ownership of the expiring raw pointer
    , destructor          // and merely capture a reference to the destructor
    };
}

// Return value of environment variable, or default string if unset
inline static auto getenvOrDefault(char const* env_var, char const* default_value)
{
    if (char const* env_value = ::getenv(env_var)) {
        return env_value;
    }
    return default_value;
};

/* cstring wrappers */
namespace cstr {
    // lifted gethostname
    static inline std::string gethostname() {
        char buf[HOST_NAME_MAX + 1];
        if (::gethostname(buf, HOST_NAME_MAX) < 0) {
            throw std::runtime_error("gethostname failed");
        }
        buf[HOST_NAME_MAX] = '\0';
        return std::string{buf};
    }
} /* namespace doorman::cstr */

/*
** Class to manage c style file descriptors. Ensures closure on destruction.
*/
class fd_handle {
private:
    int m_fd;
public:
    // Default constructor
    fd_handle()
    : m_fd{-1}
    { }
    // Default constructor with fd
    fd_handle(int fd)
    : m_fd{fd}
    {
        if (fd < 0) { throw std::runtime_error("File descriptor creation failed."); }
    }
    // Delete copy constructor
    fd_handle(const fd_handle&) = delete;
    fd_handle& operator=(const fd_handle&) = delete;
    // Move constructor
    fd_handle(fd_handle&& old)
    {
        m_fd = old.m_fd;
        old.m_fd = -1;
    }
    fd_handle& operator=(fd_handle&& other)
    {
        if (this != &other) {
            if (m_fd >= 0) close(m_fd);
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }
    // custom destructor
    ~fd_handle()
    {
        if (m_fd >= 0 ) close(m_fd);
    }
    // getter
    int fd() const { return m_fd; }
};

// Test if a file has the specified permissions
static inline bool
fileHasPerms(char const* filePath, int const perms)
{
    struct stat st;
    return filePath != nullptr
        && !stat(filePath, &st) // make sure this directory exists
        && S_ISREG(st.st_mode)  // make sure it is a regular file
        && !access(filePath, perms); // check that the file has the desired permissions
}

// Test if a file exists
static inline bool
pathExists(char const* filePath)
{
    struct stat st;
    return !stat(filePath, &st);
}

// Search PATH for an executable file, throw if not found
static inline std::string
findPath(std::string const& fileName) {
    // absolute and relative paths are not searched
    if (fileName.find('/') != std::string::npos) {
        if (fileHasPerms(fileName.c_str(), X_OK)) {
            return fileName;
        }
        throw std::runtime_error(fileName + ": not an executable file.");
    }

    auto pathStream = std::stringstream{getenvOrDefault("PATH", "/usr/local/bin:/usr/bin:/bin")};
    auto dir = std::string{};
    while (std::getline(pathStream, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto const candidate = dir + "/" + fileName;
        if (fileHasPerms(candidate.c_str(), X_OK)) {
            return candidate;
        }
    }

    throw std::runtime_error(fileName + ": Could not locate in PATH.");
}

namespace {
    static inline size_t getpwBufferSize()
    {
        size_t buf_len = 4096;
        long rl = sysconf(_SC_GETPW_R_SIZE_MAX);
        if (rl != -1) {
            buf_len = static_cast<size_t>(rl);
        }
        return buf_len;
    }
}

// Read passwd file and resize buffer as needed
static inline auto
getpwuid(uid_t const uid)
{
    auto pwd = passwd{};
    auto pwd_buf = std::vector<char>{};

    // Resize the vector
    pwd_buf.resize(getpwBufferSize());

    // Get the password file
    struct passwd *result = nullptr;
    if (auto const rc = getpwuid_r(uid,
                   &pwd,
                   pwd_buf.data(),
                   pwd_buf.size(),
                   &result)) {
        throw std::runtime_error("getpwuid_r failed: " + std::string{strerror(rc)});
    }

    // Ensure we obtained a result
    if (result == nullptr) {
        throw std::runtime_error("password file entry not found for uid " + std::to_string(uid));
    }

    return std::make_pair(std::move(pwd), std::move(pwd_buf));
}

// Same as above, keyed by username
static inline auto
getpwnam(std::string const& username)
{
    auto pwd = passwd{};
    auto pwd_buf = std::vector<char>{};

    pwd_buf.resize(getpwBufferSize());

    struct passwd *result = nullptr;
    if (auto const rc = getpwnam_r(username.c_str(),
                   &pwd,
                   pwd_buf.data(),
                   pwd_buf.size(),
                   &result)) {
        throw std::runtime_error("getpwnam_r failed: " + std::string{strerror(rc)});
    }

    if (result == nullptr) {
        throw std::runtime_error("password file entry not found for user '" + username + "'");
    }

    return std::make_pair(std::move(pwd), std::move(pwd_buf));
}

} /* namespace doorman */
