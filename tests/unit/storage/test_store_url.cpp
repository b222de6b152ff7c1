//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/storage/store_url.hpp"

#include <gtest/gtest.h>

namespace cca::storage
{
    TEST(StoreUrlTest, AbsoluteSqlitePath) {
        const auto result = parse_store_url("sqlite:///var/lib/cca/main.db");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().kind, StoreKind::SQLiteFile);
        EXPECT_EQ(result.value().path, "/var/lib/cca/main.db");
        EXPECT_EQ(result.value().url, "sqlite:///var/lib/cca/main.db");
    }

    TEST(StoreUrlTest, RelativeSqlitePath) {
        const auto result = parse_store_url("sqlite://data/main.db");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().path, "data/main.db");
    }

    TEST(StoreUrlTest, MemoryForms) {
        for (const auto* url : {"sqlite::memory:", ":memory:"}) {
            const auto result = parse_store_url(url);
            ASSERT_TRUE(result.is_ok()) << url;
            EXPECT_EQ(result.value().kind, StoreKind::SQLiteMemory);
            EXPECT_EQ(result.value().path, ":memory:");
        }
    }

    TEST(StoreUrlTest, BarePath) {
        const auto result = parse_store_url("  /tmp/findings.db  ");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().kind, StoreKind::SQLiteFile);
        EXPECT_EQ(result.value().path, "/tmp/findings.db");
    }

    TEST(StoreUrlTest, EmptyIsConfigError) {
        const auto result = parse_store_url("   ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST(StoreUrlTest, SqliteWithoutPath) {
        EXPECT_TRUE(parse_store_url("sqlite://").is_err());
        EXPECT_TRUE(parse_store_url("sqlite:///").is_err());
    }

    TEST(StoreUrlTest, UnsupportedScheme) {
        const auto result = parse_store_url("postgresql://user@db/cca");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_NE(result.error().message().find("postgresql"), std::string::npos);
    }
}
