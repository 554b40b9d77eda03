/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 * Library logging stays at spdlog's "off" level unless SHAPEQL_TEST_LOG is set.
 *
 * Build: cmake --build . --target shapeql_tests
 * Run:   ./shapeql_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(std::getenv("SHAPEQL_TEST_LOG") != nullptr ? spdlog::level::trace
                                                                 : spdlog::level::off);
    return RUN_ALL_TESTS();
}
