#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

#include "../core/Util.hpp"

using namespace lupus::core;

TEST(Util, ParseNumberRejectsValuesThatDoNotFit)
{
    EXPECT_EQ(util::ParseNumber<std::uint16_t>("9002"), std::optional<std::uint16_t>{9002});
    EXPECT_EQ(util::ParseNumber<std::uint16_t>("65535"), std::optional<std::uint16_t>{65535});
    EXPECT_EQ(util::ParseNumber<std::uint16_t>("70000"), std::nullopt);
    EXPECT_EQ(util::ParseNumber<std::uint32_t>("4294967296"), std::nullopt);
}

TEST(Util, ParseNumberWantsTheWholeString)
{
    EXPECT_EQ(util::ParseNumber<std::uint64_t>(""), std::nullopt);
    EXPECT_EQ(util::ParseNumber<std::uint64_t>("12abc"), std::nullopt);
    EXPECT_EQ(util::ParseNumber<std::uint64_t>(" 12"), std::nullopt);
    EXPECT_EQ(util::ParseNumber<std::uint64_t>("-1"), std::nullopt);
    EXPECT_EQ(util::ParseNumber<std::int64_t>("-1"), std::optional<std::int64_t>{-1});
}

TEST(Util, TrimAndNormalize)
{
    EXPECT_EQ(util::Trim("  alice \t"), "alice");
    EXPECT_EQ(util::Normalize(" YES "), "yes");
    EXPECT_TRUE(util::EqualsCaseless("Dave", "dAVE"));
    EXPECT_FALSE(util::EqualsCaseless("Dave", "Dav"));
}
