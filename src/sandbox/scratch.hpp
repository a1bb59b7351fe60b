/*
 * scratch.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef JAILCHAIN_SANDBOX_SCRATCH_HPP
#define JAILCHAIN_SANDBOX_SCRATCH_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace jailchain::sandbox {

/**
 * @brief Per-request scratch directory, removed with everything in it when
 *        the owner goes out of scope
 */
class ScratchDirectory {
public:
    /**
     * @brief Create a fresh, uniquely named directory under root
     * @param root Parent directory, created if missing
     * @param prefix Leading part of the directory name
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root,
                                     std::string_view prefix)
        -> std::expected<ScratchDirectory, std::error_code>;

    /**
     * @brief Default scratch root under the system temp directory
     */
    [[nodiscard]] static auto defaultRoot() -> std::filesystem::path;

    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
        return path_;
    }

    /**
     * @brief Write a file relative to the directory
     * @return Absolute path of the written file
     */
    [[nodiscard]] auto writeFile(const std::filesystem::path& relative,
                                 std::string_view content) const
        -> std::expected<std::filesystem::path, std::error_code>;

private:
    explicit ScratchDirectory(std::filesystem::path path);
    void remove() noexcept;

    std::filesystem::path path_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_SCRATCH_HPP
