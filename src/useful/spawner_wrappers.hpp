/******************************************************************************\
 * spawner_wrappers.hpp - A header file for utility wrappers. This is for helper
 *                        wrappers to C-style allocation and error handling
 *                        routines.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
 *
 *     Redistribution and use in source and binary forms, with or
 *     without modification, are permitted provided that the following
 *     conditions are met:
 *
 *      - Redistributions of source code must retain the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer.
 *
 *      - Redistributions in binary form must reproduce the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer in the documentation and/or other materials
 *        provided with the distribution.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 ******************************************************************************/
#pragma once

#include "spawner_defs.h"

#include <cstring>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <pwd.h>
#include <unistd.h>

namespace spawner {

// there is an std::make_unique<T> which constructs a unique_ptr of type T from its arguments.
// however, there is no equivalent that accepts a custom destructor function. this is a helper
// function to perform this deduction:
//     auto const cstr = take_pointer_ownership(strdup(...), std::free);
template <typename T, typename Destr>
inline static auto
take_pointer_ownership(T*&& expiring, Destr&& destructor) -> std::unique_ptr<T, decltype(&destructor)>
{
    static_assert(!std::is_rvalue_reference<decltype(destructor)>::value);
    static_assert(std::is_rvalue_reference<decltype(expiring)>::value);

    return std::unique_ptr<T, decltype(&destructor)>
    { std::move(expiring)
    , destructor
    };
}

// Return value of environment variable, or default string if unset
inline static std::string getenvOrDefault(char const* env_var, std::string const& default_value)
{
    if (char const* env_value = ::getenv(env_var)) {
        return env_value;
    }
    return default_value;
}

/* cstring wrappers */
namespace cstr {
    // lifted asprintf
    template <typename... Args>
    static inline std::string asprintf(char const* const formatCStr, Args&&... args) {
        char *rawResult = nullptr;
        if (::asprintf(&rawResult, formatCStr, std::forward<Args>(args)...) < 0) {
            throw std::runtime_error("asprintf failed.");
        }
        auto const result = take_pointer_ownership(std::move(rawResult), std::free);
        return std::string(result.get());
    }

    // lifted mkdtemp
    static inline std::string mkdtemp(std::string const& pathTemplate) {
        auto rawPathTemplate = take_pointer_ownership(strdup(pathTemplate.c_str()), std::free);
        if (::mkdtemp(rawPathTemplate.get())) {
            return std::string(rawPathTemplate.get());
        } else {
            throw std::runtime_error("mkdtemp failed on " + pathTemplate);
        }
    }

} /* namespace cstr */

// verify that path is a directory with the given access permissions
static inline bool dirHasPerms(char const* dirPath, int const perms)
{
    struct stat st;
    if (dirPath == nullptr) {
        return false;
    }
    if (::stat(dirPath, &st) || !S_ISDIR(st.st_mode)) {
        return false;
    }
    return ::access(dirPath, perms) == 0;
}

class fd_handle {
private:
    int m_fd;
public:
    fd_handle()
    : m_fd{-1}
    { }
    fd_handle(int fd)
    : m_fd{fd}
    {
        if (fd < 0) { throw std::runtime_error("File descriptor creation failed: " + std::string{strerror(errno)}); }
    }
    fd_handle(const fd_handle&) = delete;
    fd_handle& operator=(const fd_handle&) = delete;
    fd_handle(fd_handle&& old)
    {
        m_fd = old.m_fd;
        old.m_fd = -1;
    }
    fd_handle& operator=(fd_handle&& other)
    {
        reset();
        m_fd = other.m_fd;
        other.m_fd = -1;
        return *this;
    }
    ~fd_handle()
    {
        reset();
    }
    void reset()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }
    int fd() const { return m_fd; }
};

// Look up the home directory of a user in the password database.
// Returns std::nullopt if the user has no entry.
static inline std::optional<std::string>
getpwnamHome(std::string const& name)
{
    auto pwd = passwd{};
    auto pwd_buf = std::vector<char>{};

    size_t buf_len = 4096;
    long rl = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (rl != -1) {
        buf_len = static_cast<size_t>(rl);
    }
    pwd_buf.resize(buf_len);

    struct passwd *result = nullptr;
    if (auto const rc = getpwnam_r(name.c_str(), &pwd, pwd_buf.data(), pwd_buf.size(), &result)) {
        throw std::runtime_error("getpwnam_r failed: " + std::string{strerror(rc)});
    }

    if ((result == nullptr) || (result->pw_dir == nullptr)) {
        return std::nullopt;
    }

    return std::string{result->pw_dir};
}

} /* namespace spawner */
