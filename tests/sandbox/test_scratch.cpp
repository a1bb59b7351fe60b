/*
 * test_scratch.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "sandbox/scratch.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace jailchain::sandbox;

class ScratchDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("jailchain-scratch-test-" + std::to_string(::getpid()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
};

TEST_F(ScratchDirectoryTest, CreatesUniqueDirectories) {
    auto first = ScratchDirectory::create(root_, "exec");
    auto second = ScratchDirectory::create(root_, "exec");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->path(), second->path());
    EXPECT_TRUE(fs::is_directory(first->path()));
    EXPECT_EQ(first->path().parent_path(), root_);
}

TEST_F(ScratchDirectoryTest, RemovedOnDestruction) {
    fs::path path;
    {
        auto scratch = ScratchDirectory::create(root_, "exec");
        ASSERT_TRUE(scratch.has_value());
        path = scratch->path();
        ASSERT_TRUE(scratch->writeFile("nested/code.py", "print(1)"));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(ScratchDirectoryTest, MoveTransfersOwnership) {
    auto scratch = ScratchDirectory::create(root_, "exec");
    ASSERT_TRUE(scratch.has_value());
    auto path = scratch->path();

    ScratchDirectory moved = std::move(*scratch);
    EXPECT_EQ(moved.path(), path);
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(ScratchDirectoryTest, WriteFileReturnsAbsolutePath) {
    auto scratch = ScratchDirectory::create(root_, "exec");
    ASSERT_TRUE(scratch.has_value());

    auto file = scratch->writeFile("code.sh", "echo hi\n");
    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file->is_absolute());

    std::ifstream in(*file);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "echo hi\n");
}
