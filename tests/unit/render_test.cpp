#include "diagnostics/render.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace caret;

TEST(RenderTest, GutterWidth) {
    EXPECT_EQ(render::gutter_width(1), 1u);
    EXPECT_EQ(render::gutter_width(9), 1u);
    EXPECT_EQ(render::gutter_width(10), 2u);
    EXPECT_EQ(render::gutter_width(99), 2u);
    EXPECT_EQ(render::gutter_width(100), 3u);
    EXPECT_EQ(render::gutter_width(4294967295u), 10u);
}

// 点位置のマーカーはトークン幅に関係なく固定
TEST(RenderTest, PointUnderline) {
    EXPECT_EQ(render::point_underline(0), "^---");
    EXPECT_EQ(render::point_underline(3), "   ^---");
}

TEST(RenderTest, SpanUnderlineWide) {
    EXPECT_EQ(render::span_underline(0, 2), "^^");
    EXPECT_EQ(render::span_underline(0, 5), "^---^");
    EXPECT_EQ(render::span_underline(2, 4), "  ^--^");
}

TEST(RenderTest, SpanUnderlineWidthMatchesSpan) {
    for (size_t width = 2; width < 20; ++width) {
        auto line = render::span_underline(0, width);
        ASSERT_EQ(line.size(), width);
        EXPECT_EQ(line.front(), '^');
        EXPECT_EQ(line.back(), '^');
        EXPECT_EQ(line.substr(1, width - 2), std::string(width - 2, '-'));
    }
}

TEST(RenderTest, SpanUnderlineNarrow) {
    EXPECT_EQ(render::span_underline(0, 0), "^");
    EXPECT_EQ(render::span_underline(0, 1), "^");
    EXPECT_EQ(render::span_underline(1, 0), " ^");
}

TEST(RenderTest, Report) {
    auto text = render::report(LineColumn{2, 2}, "cd", " ^---", "expected 1 or 2");
    EXPECT_EQ(text,
              " --> 2:2\n"
              "  |\n"
              "2 | cd\n"
              "  |  ^---\n"
              "  |\n"
              "  = expected 1 or 2");
}

TEST(RenderTest, ReportWideGutter) {
    auto text = render::report(LineColumn{123, 1}, "x", "^---", "oops");
    EXPECT_EQ(text,
              "   --> 123:1\n"
              "    |\n"
              "123 | x\n"
              "    | ^---\n"
              "    |\n"
              "    = oops");
}

TEST(RenderTest, ReportEmptyLine) {
    auto text = render::report(LineColumn{1, 1}, "", "^---", "unknown parsing error");
    EXPECT_EQ(text,
              " --> 1:1\n"
              "  |\n"
              "1 | \n"
              "  | ^---\n"
              "  |\n"
              "  = unknown parsing error");
}
