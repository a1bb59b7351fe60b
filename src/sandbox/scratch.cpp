/*
 * scratch.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "scratch.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

namespace fs = std::filesystem;

auto ScratchDirectory::create(const fs::path& root, std::string_view prefix)
    -> std::expected<ScratchDirectory, std::error_code> {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        spdlog::error("Failed to create scratch root {}: {}", root.string(),
                      ec.message());
        return std::unexpected(ec);
    }

    std::string pattern = (root / (std::string(prefix) + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        ec = std::error_code(errno, std::generic_category());
        spdlog::error("Failed to create scratch directory under {}: {}",
                      root.string(), ec.message());
        return std::unexpected(ec);
    }

    fs::path created(buffer.data());
    spdlog::debug("Created scratch directory {}", created.string());
    return ScratchDirectory(std::move(created));
}

auto ScratchDirectory::defaultRoot() -> fs::path {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "jailchain";
}

ScratchDirectory::ScratchDirectory(fs::path path) : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() { remove(); }

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::exchange(other.path_, fs::path{})) {}

ScratchDirectory& ScratchDirectory::operator=(
    ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, fs::path{});
    }
    return *this;
}

auto ScratchDirectory::writeFile(const fs::path& relative,
                                 std::string_view content) const
    -> std::expected<fs::path, std::error_code> {
    auto target = path_ / relative;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return std::unexpected(ec);
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(
            std::make_error_code(std::errc::permission_denied));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return target;
}

void ScratchDirectory::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch directory {}: {}",
                     path_.string(), ec.message());
    } else {
        spdlog::debug("Removed scratch directory {}", path_.string());
    }
    path_.clear();
}

}  // namespace jailchain::sandbox
