/*
 * rootfs_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "rootfs_builder.hpp"

#include "sandbox/process/subprocess.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

namespace fs = std::filesystem;

namespace {

constexpr auto kLddTimeout = std::chrono::seconds(10);

auto skippedTreeEntry(const fs::path& name) -> bool {
    static const std::set<std::string> kSkipped = {
        "site-packages", "dist-packages", "test",     "tests",
        "idlelib",       "turtledemo",    "ensurepip", "tkinter"};
    return kSkipped.contains(name.string());
}

auto destinationFor(const fs::path& root, const fs::path& source) -> fs::path {
    return root / source.relative_path();
}

}  // namespace

auto parseLddOutput(std::string_view output) -> std::vector<fs::path> {
    std::vector<fs::path> libraries;
    std::istringstream stream{std::string(output)};
    std::string line;

    while (std::getline(stream, line)) {
        std::string candidate;
        auto arrow = line.find("=>");
        std::istringstream tokens(arrow != std::string::npos
                                      ? line.substr(arrow + 2)
                                      : line);
        tokens >> candidate;

        if (candidate.empty() || candidate.front() != '/') {
            continue;
        }
        fs::path path(candidate);
        if (std::find(libraries.begin(), libraries.end(), path) ==
            libraries.end()) {
            libraries.push_back(std::move(path));
        }
    }
    return libraries;
}

RootfsBuilder::RootfsBuilder(std::string lddBinary)
    : lddBinary_(std::move(lddBinary)) {}

auto RootfsBuilder::skeletonDirectories() -> const std::vector<std::string>& {
    static const std::vector<std::string> kDirectories = {
        "bin",  "usr/bin",      "lib", "lib64", "usr/lib", "usr/lib64",
        "tmp",  "home/sandbox", "proc", "dev",  "sys",     "etc"};
    return kDirectories;
}

auto RootfsBuilder::librariesOf(const fs::path& binary) const
    -> std::vector<fs::path> {
    process::SpawnOptions options;
    options.argv = {lddBinary_, binary.string()};
    options.timeout = kLddTimeout;

    auto result = process::runProcess(options);
    if (!result || !result->success()) {
        spdlog::debug("ldd gave no libraries for {}", binary.string());
        return {};
    }
    return parseLddOutput(result->stdoutText);
}

auto RootfsBuilder::mirrorFile(const fs::path& root, const fs::path& source)
    -> bool {
    std::error_code ec;
    auto resolved = fs::canonical(source, ec);
    if (ec) {
        spdlog::debug("Skipping {}: {}", source.string(), ec.message());
        return false;
    }

    // The file must be reachable under its linked name, and under its
    // resolved name when that differs (symlinked loaders, merged /usr)
    std::vector<fs::path> targets = {destinationFor(root, source)};
    if (resolved != source) {
        targets.push_back(destinationFor(root, resolved));
    }

    bool mirrored = false;
    for (const auto& target : targets) {
        if (fs::exists(target, ec)) {
            mirrored = true;
            continue;
        }
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::warn("Failed to create {}: {}",
                         target.parent_path().string(), ec.message());
            continue;
        }
        fs::create_hard_link(resolved, target, ec);
        if (ec) {
            ec.clear();
            fs::copy_file(resolved, target,
                          fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            spdlog::warn("Failed to mirror {}: {}", source.string(),
                         ec.message());
            continue;
        }
        mirrored = true;
    }
    return mirrored;
}

auto RootfsBuilder::mirrorTree(const fs::path& root, const fs::path& source)
    -> std::size_t {
    std::size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        source, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot read {}: {}", source.string(), ec.message());
        return 0;
    }
    fs::create_directories(destinationFor(root, source), ec);
    if (ec) {
        spdlog::warn("Cannot create {}: {}",
                     destinationFor(root, source).string(), ec.message());
        return 0;
    }

    const auto end = fs::end(it);
    for (; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("Error walking {}: {}", source.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        auto target = destinationFor(root, entry.path());

        if (entry.is_symlink(ec)) {
            auto link = fs::read_symlink(entry.path(), ec);
            if (!ec) {
                fs::create_directories(target.parent_path(), ec);
                fs::create_symlink(link, target, ec);
            }
            ec.clear();
            continue;
        }
        if (entry.is_directory(ec)) {
            if (skippedTreeEntry(entry.path().filename())) {
                it.disable_recursion_pending();
            } else {
                fs::create_directories(target, ec);
            }
            ec.clear();
            continue;
        }
        if (entry.is_regular_file(ec)) {
            fs::create_hard_link(entry.path(), target, ec);
            if (ec) {
                ec.clear();
                fs::copy_file(entry.path(), target,
                              fs::copy_options::overwrite_existing, ec);
            }
            if (!ec) {
                ++count;
            }
            ec.clear();
        }
    }
    return count;
}

auto RootfsBuilder::build(const fs::path& root,
                          const std::vector<fs::path>& binaries,
                          const std::vector<fs::path>& trees) const
    -> std::expected<void, std::string> {
    std::error_code ec;
    for (const auto& dir : skeletonDirectories()) {
        fs::create_directories(root / dir, ec);
        if (ec) {
            return std::unexpected("Failed to create " + (root / dir).string() +
                                   ": " + ec.message());
        }
    }
    fs::permissions(root / "tmp", fs::perms::all | fs::perms::sticky_bit, ec);

    std::set<fs::path> libraries;
    for (const auto& binary : binaries) {
        if (!mirrorFile(root, binary)) {
            spdlog::debug("Binary {} not mirrored", binary.string());
            continue;
        }
        for (auto& lib : librariesOf(binary)) {
            libraries.insert(std::move(lib));
        }
    }
    for (const auto& lib : libraries) {
        if (!mirrorFile(root, lib)) {
            spdlog::debug("Library {} not mirrored", lib.string());
        }
    }

    for (const auto& tree : trees) {
        auto files = mirrorTree(root, tree);
        spdlog::debug("Mirrored {} files from {}", files, tree.string());
    }

    spdlog::debug("Jail root ready at {} ({} binaries, {} libraries)",
                  root.string(), binaries.size(), libraries.size());
    return {};
}

}  // namespace jailchain::sandbox
