#pragma once

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace OpenFw {

namespace Exceptions {

/**
 * Exception to throw upon violation of internal contracts that are expected
 * to hold regardless of the input images or user-provided layouts.
 *
 * ValidateContract provides a drop-in replacement for assert that throws
 * exceptions of this kind.
 */
struct ContractViolated : std::logic_error {
    ContractViolated(std::string_view condition, std::string_view function, std::string_view file, int line)
        : std::logic_error(FormatMessage(condition, function, file, line)) {
    }

    static std::string FormatMessage(std::string_view condition, std::string_view function, std::string_view file, int line);
};

/**
 * Exception to throw when an API precondition is violated by the caller,
 * for instance when asked to encode a payload that does not fit the 32-bit
 * size fields of the container.
 */
struct Invalid : std::runtime_error {
    template<typename... T>
    Invalid(const char* message, T&&... ts) : std::runtime_error(fmt::format(fmt::runtime(message), std::forward<T>(ts)...)) {
    }
};

/**
 * Exception to throw when the user provides invalid input, for example from
 * a command-line argument, a layout descriptor or a key file.
 *
 * Codec logic should never use this.
 */
struct InvalidUserInput : std::runtime_error {
    template<typename... T>
    InvalidUserInput(const char* message, T&&... ts) : std::runtime_error(fmt::format(fmt::runtime(message), std::forward<T>(ts)...)) {
    }
};

} // namespace Exceptions

} // namespace OpenFw

// ValidateContract is implemented as a macro so that we can stringify the failed condition
#ifdef NDEBUG
#define ValidateContract(cond) do { if (!(cond)) { \
        throw OpenFw::Exceptions::ContractViolated(#cond, __PRETTY_FUNCTION__, __FILE__, __LINE__); \
    } } while (false)
#else
// Use assert() directly in debug mode
#define ValidateContract(cond) do { if (!(cond)) { \
        fputs(OpenFw::Exceptions::ContractViolated::FormatMessage(#cond, __PRETTY_FUNCTION__, __FILE__, __LINE__).c_str(), stderr); \
        assert((cond)); \
    } } while (false)
#endif
