#include "conduit/utility.hpp"

#include <array>
#include <cstdlib>
#include <cxxabi.h>
#include <format>
#include <memory>

namespace conduit {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::step:
        return "step";
    case ErrorKind::internal:
        return "internal";
    case ErrorKind::shell:
        return "shell";
    case ErrorKind::missing_secret:
        return "missing secret";
    case ErrorKind::environment:
        return "environment";
    case ErrorKind::cleanup:
        return "cleanup";
    case ErrorKind::invalid_argument:
        return "invalid argument";
    case ErrorKind::decoding:
        return "decoding";
    }
    return "unknown";
}

std::string describe(const Error &error) {
    if (error.kind == ErrorKind::internal) {
        std::string out = std::format("Internal Workflow Error: {}", error.message);
        if (error.location) {
            out += std::format("\n(file: {}, line: {}, function: {})",
                               error.location->file_name(),
                               error.location->line(),
                               error.location->function_name());
        }
        return out;
    }
    if (error.message.empty()) {
        return error.detail.empty() ? std::format("{} error", to_string(error.kind)) : error.detail;
    }
    if (!error.detail.empty() && error.detail != error.message) {
        return std::format("{}\n{}", error.message, error.detail);
    }
    return error.message;
}

std::string type_name(const std::type_info &info) {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled{
        abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), &std::free};
    std::string name = (status == 0 && demangled) ? demangled.get() : info.name();

    // strip qualifiers that precede the outermost template argument list
    size_t template_start = name.find('<');
    size_t scope = name.rfind("::", template_start);
    if (scope != std::string::npos) {
        name.erase(0, scope + 2);
    }
    return name;
}

std::string shell_escape(std::string_view arg) {
    if (arg.empty()) {
        return "''";
    }
    bool safe = true;
    for (char c : arg) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                  c == '_' || c == '.' || c == '/' || c == ':' || c == '=' || c == '@' || c == '+' || c == ',';
        if (!ok) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string(arg);
    }

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::optional<std::string> base64_decode(std::string_view input) {
    static constexpr std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (size_t i = 0; i < alphabet.size(); ++i) {
            t[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();

    std::string out;
    out.reserve(input.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : input) {
        if (c == '=') {
            ++padding;
            continue;
        }
        int8_t value = table[static_cast<unsigned char>(c)];
        if (value < 0) {
            continue;
        }
        if (padding > 0) {
            // data after padding
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    if (symbols % 4 == 1 || padding > 2) {
        return std::nullopt;
    }
    return out;
}

} // namespace conduit
