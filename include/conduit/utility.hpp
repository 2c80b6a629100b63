#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <typeinfo>

namespace conduit {

enum class ErrorKind : uint8_t {
    step,             ///< Raised by a step or workflow `run`.
    internal,         ///< Engine-detected fatal condition (workspace setup).
    shell,            ///< A shell command exited non-zero or failed to launch.
    missing_secret,   ///< A secret backend could not find its value.
    environment,      ///< A required environment variable is absent.
    cleanup,          ///< Raised by a step's `cleanup` during unwind.
    invalid_argument, ///< Bad command line input.
    decoding,         ///< Malformed payload (base64, JSON).
};

/**
 * @brief Failure value carried through every `Result`.
 *
 * `message` is the human-readable description, `detail` the raw text (stderr
 * of a failed command, parser diagnostics) when one exists.
 */
struct Error {
    ErrorKind kind = ErrorKind::step;
    std::string message;
    std::string detail;
    std::optional<std::source_location> location = std::nullopt;

    static Error step(std::string message, std::string detail = {}) {
        return {ErrorKind::step, std::move(message), std::move(detail)};
    }

    static Error internal(std::string message, std::source_location where = std::source_location::current()) {
        return {ErrorKind::internal, std::move(message), {}, where};
    }

    static Error of(ErrorKind kind, std::string message, std::string detail = {}) {
        return {kind, std::move(message), std::move(detail)};
    }
};

template <typename T>
using Result = std::expected<T, Error>;

using Seconds = std::chrono::duration<double>;

std::string_view to_string(ErrorKind kind);

/**
 * @brief Renders an error for the user.
 *
 * Internal errors include the location they were raised from. Other errors
 * print the message and, when it adds something, the raw detail.
 */
std::string describe(const Error &error);

/// Demangled type name without namespace qualifiers ("Build", not "demo::Build").
std::string type_name(const std::type_info &info);

/// Quotes `arg` for /bin/sh when it contains anything outside a safe set.
std::string shell_escape(std::string_view arg);

/// Strict-enough base64 decoding; characters outside the alphabet are skipped.
std::optional<std::string> base64_decode(std::string_view input);

} // namespace conduit
