/**
 * Unit tests for the backend selector
 */

#include <gtest/gtest.h>

#include "engine/search_type.hpp"

using namespace macroenv::engine;
using macroenv::core::BackendKind;

TEST(SearchTypeTest, StringConversions) {
    EXPECT_STREQ("file", search_type_to_string(SearchType::FILE));
    EXPECT_STREQ("system", search_type_to_string(SearchType::SYSTEM));
    EXPECT_STREQ("input", search_type_to_string(SearchType::INPUT));
    EXPECT_STREQ("all", search_type_to_string(SearchType::ALL));
}

TEST(SearchTypeTest, FromString) {
    EXPECT_EQ(search_type_from_string("file"), SearchType::FILE);
    EXPECT_EQ(search_type_from_string("System"), SearchType::SYSTEM);
    EXPECT_EQ(search_type_from_string("INPUT"), SearchType::INPUT);
    EXPECT_EQ(search_type_from_string("all"), SearchType::ALL);
    EXPECT_FALSE(search_type_from_string("dotenv").has_value());
    EXPECT_FALSE(search_type_from_string("").has_value());
}

TEST(SearchTypeTest, BackendOrder) {
    EXPECT_EQ(backend_order(SearchType::FILE), std::vector<BackendKind>{BackendKind::FILE});
    EXPECT_EQ(backend_order(SearchType::SYSTEM), std::vector<BackendKind>{BackendKind::SYSTEM});
    EXPECT_EQ(backend_order(SearchType::INPUT), std::vector<BackendKind>{BackendKind::INPUT});

    std::vector<BackendKind> all = {BackendKind::FILE, BackendKind::SYSTEM, BackendKind::INPUT};
    EXPECT_EQ(backend_order(SearchType::ALL), all);
}
