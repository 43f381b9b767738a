/*********************************************************************************\
 * spawner_argv.hpp: Interface for handling argv.
 *
 * Copyright 2019-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

#include <vector>
#include <string>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <ctype.h>
#include <getopt.h>
#include <string.h>
#include <stdlib.h>

namespace spawner {

// Split a KEY=VALUE environment string. Throws std::runtime_error if there is
// no '=' or the name is empty.
inline std::pair<std::string, std::string> splitEnvString(std::string const& var) {
    auto const eq = var.find('=');
    if ((eq == std::string::npos) || (eq == 0)) {
        throw std::runtime_error("Bad environment variable string: \"" + var + "\"");
    }
    return {var.substr(0, eq), var.substr(eq + 1)};
}

// Owns a nullptr-terminated argument array suitable for execvp
class ManagedArgv {
private:
    std::vector<char*> argv;

public:
    /* constructor creates NULL-terminator. */
    ManagedArgv() {
        argv.push_back(nullptr);
    }

    ManagedArgv(std::initializer_list<std::string const> str_list) {
        argv.reserve(str_list.size() + 1);
        for (auto&& str : str_list) {
            argv.push_back(strdup(str.c_str()));
        }
        argv.push_back(nullptr);
    }

    /* destructor frees the strdup'ed memory */
    ~ManagedArgv() {
        for (char* str : argv) {
            free(str);
        }
    }

    ManagedArgv(ManagedArgv const&) = delete;
    ManagedArgv& operator=(ManagedArgv const&) = delete;

    /* move constructor: destructive move the array */
    ManagedArgv(ManagedArgv&& moved)
        : argv{std::move(moved.argv)}
    {
        moved.argv = {nullptr};
    }

    /* member methods */
    size_t size() const { return argv.size(); }
    char* const* get() const { return argv.data(); }

    // name of the binary, or empty if no arguments were added
    std::string binary() const { return (argv.size() > 1) ? argv[0] : ""; }

    void add(std::string const& str) {
        argv.insert(argv.end() - 1, strdup(str.c_str()));
    }

    void add(const char* str) {
        if (str == nullptr) {
            throw std::logic_error("attempted to add nullptr pointer to managed argument array");
        }
        argv.insert(argv.end() - 1, strdup(str));
    }

    void add(std::vector<std::string> const& args) {
        for (auto&& arg : args) {
            add(arg);
        }
    }

    // quote the arguments to ensure that the logged command line
    // is copy-pastable into a terminal
    std::string string() const {
        std::ostringstream r;

        if (argv.size() > 1)
            r << argv[0];

        for (size_t i = 1; i < argv.size() - 1; i++) {
            r << ' ' << '"' << argv[i] << '"';
        }

        return r.str();
    }
};

struct Argv {
    using GNUOption = struct option;
    static constexpr GNUOption long_options_done { nullptr, 0, nullptr, 0 };

    struct Option : public GNUOption {
        explicit constexpr Option(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, no_argument, nullptr, shortFlag } {}
    };

    struct Parameter : public GNUOption {
        explicit constexpr Parameter(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, required_argument, nullptr, shortFlag } {}
    };
};

template <class ArgvDef>
class IncomingArgv : public ArgvDef {
private:
    const int m_argc;
    char* const* m_argv;
    std::string m_flagSpec;
    int m_optind;

public:
    IncomingArgv(int argc, char* const* argv)
        : m_argc(argc)
        , m_argv(argv)
        , m_flagSpec{"+"} // Follow POSIX behavior, do not reorder
        , m_optind{0}
    {
        for (const Argv::GNUOption* opt_ptr = ArgvDef::long_options;
            opt_ptr->name != nullptr; opt_ptr++) {
            if (::isalpha(opt_ptr->val)) {
                m_flagSpec.push_back((char)(opt_ptr->val));
                if (opt_ptr->has_arg != no_argument) {
                    m_flagSpec.push_back(':');
                }
            }
        }
    }

    // returns (-1, "") once all options are consumed
    std::pair<int, std::string> get_next() {
        auto const old_optind = optind;
        optind = m_optind;
        int c = getopt_long(m_argc, m_argv, m_flagSpec.c_str(), ArgvDef::long_options, nullptr);
        m_optind = optind;
        optind = old_optind;
        if ((c < 0) || (optarg == nullptr)) {
            return std::make_pair(c, "");
        }
        return std::make_pair(c, optarg);
    }

    std::vector<std::string> get_rest() const {
        return std::vector<std::string>(m_argv + m_optind, m_argv + m_argc);
    }
};

} /* namespace spawner */
