/**
 * @file test_main.cpp
 * @brief Entry point for the toon_tests GoogleTest binary
 *
 * Covers the codec suites (value model, quoting, format selection,
 * parser, writer, round trips, errors) and the JSON bridge, binding and
 * CLI suites. The file loader suite is a separate Catch2 binary.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
