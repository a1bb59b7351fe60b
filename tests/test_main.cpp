/*
 * test_main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_main.cpp
 * @brief Test entry point owning the embedded Python interpreter
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

int main(int argc, char** argv) {
    ::testing::InitGoogleMock(&argc, argv);
    spdlog::set_level(spdlog::level::warn);

    // Tiers acquire the GIL themselves, from whichever thread runs them.
    py::scoped_interpreter interpreter;
    py::gil_scoped_release release;

    return RUN_ALL_TESTS();
}
