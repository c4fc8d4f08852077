/**
 * Unit tests for the process environment backend
 */

#include <gtest/gtest.h>

#include "backends/system_backend.hpp"
#include "test_helpers.hpp"

using namespace macroenv::backends;
using macroenv::core::ErrorKind;
using macroenv::test::ScopedEnv;

TEST(SystemBackendTest, ReadsEnvironment) {
    ScopedEnv env("MACROENV_TEST_OS", std::string("Linux"));

    auto result = SystemBackend().lookup("MACROENV_TEST_OS");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value, "Linux");
}

TEST(SystemBackendTest, UnsetIsNotFound) {
    ScopedEnv env("MACROENV_TEST_UNSET", std::nullopt);

    auto result = SystemBackend().lookup("MACROENV_TEST_UNSET");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::NOT_FOUND);
}

TEST(SystemBackendTest, NoNormalization) {
    ScopedEnv env("MACROENV_TEST_CASE", std::string("  padded  "));
    SystemBackend backend;

    EXPECT_EQ(backend.lookup("MACROENV_TEST_CASE").value, "  padded  ");
    EXPECT_FALSE(backend.lookup("macroenv_test_case").success);
}

TEST(SystemBackendTest, EmptyValueIsFound) {
    ScopedEnv env("MACROENV_TEST_EMPTY", std::string(""));

    auto result = SystemBackend().lookup("MACROENV_TEST_EMPTY");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value, "");
}
