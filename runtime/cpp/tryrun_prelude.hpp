//===----------------------------------------------------------------------===//
//
// Part of the tryrun project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Prelude force-included into every submitted translation unit.
///
/// The prelude pulls in the common standard headers, provides the `Console`
/// output helper, and installs a terminate handler that reports uncaught
/// exceptions on standard error behind a marker the daemon recognizes.
///
//===----------------------------------------------------------------------===//

#ifndef TRYRUN_PRELUDE_HPP
#define TRYRUN_PRELUDE_HPP

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <numeric>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cxxabi.h>

namespace tryrun_prelude
{

/// @brief Line-oriented writer bound to standard output.
///
/// Every call flushes so output survives an abrupt termination.
struct ConsoleWriter
{
    template <typename... Args>
    void Write(const Args&... args) const
    {
        (std::cout << ... << args);
        std::cout.flush();
    }

    template <typename... Args>
    void WriteLine(const Args&... args) const
    {
        (std::cout << ... << args);
        std::cout << '\n';
        std::cout.flush();
    }
};

inline std::string describeCurrentException()
{
    const std::exception_ptr current = std::current_exception();
    if (!current)
    {
        return "std::terminate called without an active exception";
    }

    const std::type_info* type = abi::__cxa_current_exception_type();
    std::string           name = "unknown exception";
    if (type != nullptr)
    {
        int   status    = 0;
        char* demangled = abi::__cxa_demangle(type->name(), nullptr, nullptr, &status);
        name            = (status == 0 && demangled != nullptr) ? demangled : type->name();
        std::free(demangled);
    }

    try
    {
        std::rethrow_exception(current);
    } catch (const std::exception& ex)
    {
        return name + ": " + ex.what();
    } catch (...)
    {
        return name;
    }
}

[[noreturn]] inline void reportTermination()
{
    std::cout.flush();
    std::fprintf(stderr, "__tryrun_exception__: %s\n", describeCurrentException().c_str());
    std::fflush(stderr);
    std::abort();
}

inline const bool terminateHandlerInstalled = []() {
    std::set_terminate(&reportTermination);
    return true;
}();

}  // namespace tryrun_prelude

inline constexpr tryrun_prelude::ConsoleWriter Console{};

#endif  // TRYRUN_PRELUDE_HPP
