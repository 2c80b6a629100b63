#include "conduit/steps/temporary_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

namespace conduit {

Result<std::filesystem::path> TemporaryDirectoryStep::run() {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(Error::step(std::format("No temporary directory available: {}", ec.message())));
    }

    std::string pattern = (base / (prefix_ + ".XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return std::unexpected(
            Error::step(std::format("Failed to create temporary directory {}: {}", pattern, std::strerror(errno))));
    }

    path_ = pattern;
    logger().debug("Created temporary directory {}", path_.string());
    return path_;
}

Result<void> TemporaryDirectoryStep::cleanup(const std::optional<Error> &) {
    if (path_.empty())
        return {};

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        return std::unexpected(
            Error::of(ErrorKind::cleanup, std::format("Failed to remove {}: {}", path_.string(), ec.message())));
    }
    logger().debug("Removed temporary directory {}", path_.string());
    return {};
}

} // namespace conduit
