#include <gtest/gtest.h>
#include "utils/to_hexdump.hpp"

static const std::string SAMPLE("12345\0\r\n\t .abcdef", 17);

TEST(to_hexdump, format_line) {
    Line line = *to_hexdump(SAMPLE).next();
    EXPECT_EQ("[|31323334 35000d0a 09202e61 62636465| 12345.... .abcde 00000000]", fmt::format("[{}]", line));
}

TEST(to_hexdump, format_sequence_as_block) {
    std::string expected =
        "header:\n"
        "    |31323334 35000d0a 09202e61 62636465| 12345.... .abcde 00000000\n"
        "    |66|                                  f                00000010\n"
        "                                                           00000011";
    EXPECT_EQ(expected, fmt::format("header:{}", to_hexdump(SAMPLE)));
}

TEST(to_hexdump, format_does_not_consume) {
    Hexdump hd = to_hexdump(SAMPLE);
    std::string a = fmt::format("{}", hd);
    std::string b = fmt::format("{}", hd);
    EXPECT_EQ(a, b);
    EXPECT_EQ(3, hd.size());
}

TEST(to_hexdump, format_remaining_only) {
    Hexdump hd = to_hexdump(SAMPLE);
    hd.next();
    hd.next_back();
    EXPECT_EQ("\n    |66|                                  f                00000010", fmt::format("{}", hd));
}

TEST(to_hexdump, max_size) {
    Hexdump hd = to_hexdump(SAMPLE, 5);
    EXPECT_EQ(5, hd.length());
    EXPECT_EQ(2, hd.size());
}

TEST(to_hexdump, max_size_larger_than_string) {
    EXPECT_EQ(17, to_hexdump(SAMPLE, 100).length());
}

TEST(to_hexdump, vector) {
    std::vector<uint8_t> buf(33);
    EXPECT_EQ(4, to_hexdump(buf).size());
}

TEST(hexdump_to_string, no_indent_no_prefix) {
    std::string s = hexdump_to_string(to_hexdump("", 0));
    EXPECT_EQ(std::string(HEXDUMP_LINE_WIDTH - 8, ' ') + "00000000", s);
}

TEST(hexdump_to_string, prefix_and_indent) {
    std::string s = hexdump_to_string(to_hexdump("A", 1), 2, ">");
    EXPECT_EQ(
        ">  |41|                                  A                00000000\n"
        "                                                         00000001",
        s);
}
