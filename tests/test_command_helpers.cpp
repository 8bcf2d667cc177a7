#include <gtest/gtest.h>
#include <cli/commands/command_helpers.hpp>

TEST(CommandHelpers, ParseArgsSplitsOptions) {
    auto args = parse_args("  7 qty=2  vram_gb=40 extra ");
    EXPECT_EQ(args.positional, (std::vector<std::string>{"7", "extra"}));
    EXPECT_EQ(args.get("qty"), "2");
    EXPECT_EQ(args.get("vram_gb"), "40");
    EXPECT_EQ(args.get("missing", "x"), "x");
    EXPECT_FALSE(args.has("missing"));
}

TEST(CommandHelpers, ParseIdAcceptsDigitsOnly) {
    EXPECT_EQ(parse_id("42"), std::optional<int>(42));
    EXPECT_EQ(parse_id("0"), std::optional<int>(0));
    EXPECT_FALSE(parse_id("").has_value());
    EXPECT_FALSE(parse_id("-1").has_value());
    EXPECT_FALSE(parse_id("12a").has_value());
    EXPECT_FALSE(parse_id("4 2").has_value());
}

TEST(CommandHelpers, ParseIdRejectsNonAsciiBytes) {
    // UTF-8 text: bytes above 0x7f must not reach isdigit as negative chars
    EXPECT_FALSE(parse_id("\xc3\xa9").has_value());
    EXPECT_FALSE(parse_id("1\xef\xbc\x92").has_value());   // fullwidth digit two
}
