#include <gtest/gtest.h>

#include "core/template/template.hpp"
#include "core/template/template_parser.hpp"

using namespace mlprogress::core;
using mlprogress::infra::ErrorCode;

TEST(TemplateParserTest, EmptyTextGivesDefaultItems)
{
    auto parsed = parse_template("   ");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), default_items().size());
    EXPECT_EQ(parsed->front().kind, ItemKind::BarFill);
}

TEST(TemplateParserTest, DefaultTemplateText)
{
    auto parsed = parse_template(R"tpl(bar_fill " " pos "/" total " (" eta ")")tpl");
    ASSERT_TRUE(parsed);
    const auto expected = default_items();
    ASSERT_EQ(parsed->size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ((*parsed)[i].kind, expected[i].kind) << i;
        EXPECT_EQ((*parsed)[i].mode, expected[i].mode) << i;
        EXPECT_EQ((*parsed)[i].text, expected[i].text) << i;
    }
}

TEST(TemplateParserTest, BareNamesUseDefaultFormats)
{
    auto parsed = parse_template("percent pos_group speed_bin");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), 3u);

    EXPECT_EQ((*parsed)[0].kind, ItemKind::Percent);
    EXPECT_EQ((*parsed)[0].text, "{:3.0}%");

    EXPECT_EQ((*parsed)[1].kind, ItemKind::Pos);
    EXPECT_EQ((*parsed)[1].mode, NumberMode::Grouped);
    EXPECT_EQ((*parsed)[1].text, "{:#}");

    EXPECT_EQ((*parsed)[2].kind, ItemKind::Speed);
    EXPECT_EQ((*parsed)[2].mode, NumberMode::BinaryPrefix);
    EXPECT_EQ((*parsed)[2].text, "{:#} {}");
}

TEST(TemplateParserTest, ParenthesizedFormatAndNone)
{
    auto parsed = parse_template(R"((eta "{} {}" "?") (pos_bin "{:#}{}B"))");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), 2u);

    EXPECT_EQ((*parsed)[0].kind, ItemKind::Eta);
    EXPECT_EQ((*parsed)[0].text, "{} {}");
    EXPECT_EQ((*parsed)[0].none, "?");

    EXPECT_EQ((*parsed)[1].mode, NumberMode::BinaryPrefix);
    EXPECT_EQ((*parsed)[1].text, "{:#}{}B");
}

TEST(TemplateParserTest, LiteralEscapes)
{
    auto parsed = parse_template(R"("a\"b\\c\td")");
    ASSERT_TRUE(parsed);
    ASSERT_EQ(parsed->size(), 1u);
    EXPECT_EQ((*parsed)[0].kind, ItemKind::Literal);
    EXPECT_EQ((*parsed)[0].text, "a\"b\\c\td");
}

TEST(TemplateParserTest, SyntaxErrors)
{
    for (const auto* text : {
             "nope",
             R"("unterminated)",
             R"((pos "{}")",
             R"((pos "{}" "none"))",
             R"((bar_fill "x"))",
             "(pos)",
             R"("bad \q escape")",
             "custom",
             "pos, total",
         }) {
        auto parsed = parse_template(text);
        ASSERT_FALSE(parsed) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::TemplateSyntax) << text;
    }
}

TEST(TemplateParserTest, ParsedItemsStillValidated)
{
    auto parsed = parse_template("bar_fill message_fill");
    ASSERT_TRUE(parsed);
    auto tpl = build_template(std::move(*parsed));
    ASSERT_FALSE(tpl);
    EXPECT_EQ(tpl.error().code, ErrorCode::MultipleFillItems);
}
