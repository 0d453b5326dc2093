/******************************************************************************\
 * fleet_wrappers.hpp - A header file for utility wrappers. This is for helper
 *                      wrappers to C-style allocation and error handling routines.
 *
 * Copyright 2019-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <sys/types.h>
#include <sys/stat.h>

#include <errno.h>
#include <unistd.h>

namespace fleet {

// there is an std::make_unique<T> which constructs a unique_ptr of type T from its arguments.
// however, there is no equivalent that accepts a custom destructor function. normally, one would
// have to explicitly provide the types of T and its destructor function:
//     std::unique_ptr<T, decltype(&destructor)>{new T{}, destructor}
// this is a helper function to perform this deduction:
//     take_pointer_ownership(new T{}, destructor)
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
        if (fd < 0) { throw std::runtime_error("File descriptor creation failed: " + std::string{strerror(errno)}); }
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
        if (m_fd >= 0) { close(m_fd); }
        m_fd = other.m_fd;
        other.m_fd = -1;
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

// Test if a directory has the specified permissions
static inline bool
dirHasPerms(char const* dirPath, int const perms)
{
    struct stat st;
    return dirPath != nullptr
        && !stat(dirPath, &st) // make sure this directory exists
        && S_ISDIR(st.st_mode) // make sure it is a directory
        && !access(dirPath, perms); // check that the directory has the desired permissions
}

// Test if a file has the specified permissions
static inline bool
fileHasPerms(char const* filePath, int const perms)
{
    struct stat st;
    return filePath != nullptr
        && !stat(filePath, &st) // make sure this file exists
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

} /* namespace fleet */
