/*
 * rootfs_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_ROOTFS_BUILDER_HPP
#define JAILCHAIN_SANDBOX_TIERS_ROOTFS_BUILDER_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Shared libraries named in `ldd` output
 *
 * Handles both "libfoo.so => /path/libfoo.so (0x...)" lines and the bare
 * dynamic loader line "/lib64/ld-linux-x86-64.so.2 (0x...)". Virtual and
 * unresolved entries are skipped.
 */
[[nodiscard]] auto parseLddOutput(std::string_view output)
    -> std::vector<std::filesystem::path>;

/**
 * @brief Builds a minimal root filesystem for a chroot jail
 *
 * Files are mirrored at their host paths below the root, hard-linked where
 * the scratch area shares a filesystem with the source and copied
 * otherwise.
 */
class RootfsBuilder {
public:
    explicit RootfsBuilder(std::string lddBinary = "ldd");

    [[nodiscard]] static auto skeletonDirectories()
        -> const std::vector<std::string>&;

    /**
     * @brief Create the skeleton, binaries with their library closure, and
     *        the given directory trees
     * @param root Empty directory that becomes the jail root
     * @param binaries Executables to mirror
     * @param trees Directory trees (e.g. the interpreter's stdlib)
     */
    [[nodiscard]] auto build(const std::filesystem::path& root,
                             const std::vector<std::filesystem::path>& binaries,
                             const std::vector<std::filesystem::path>& trees)
        const -> std::expected<void, std::string>;

    /**
     * @brief Libraries a binary needs, per ldd
     */
    [[nodiscard]] auto librariesOf(const std::filesystem::path& binary) const
        -> std::vector<std::filesystem::path>;

    /**
     * @brief Mirror one file at its host path below root
     */
    [[nodiscard]] static auto mirrorFile(const std::filesystem::path& root,
                                         const std::filesystem::path& source)
        -> bool;

    /**
     * @brief Mirror a directory tree, skipping tests and site-packages
     * @return Number of files mirrored
     */
    [[nodiscard]] static auto mirrorTree(const std::filesystem::path& root,
                                         const std::filesystem::path& source)
        -> std::size_t;

private:
    std::string lddBinary_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_ROOTFS_BUILDER_HPP
