/**
 * @file test_placeholder_renderer.cpp
 * @brief Unit tests for value-template rendering
 */

#include <gtest/gtest.h>
#include "PlaceholderRenderer.hpp"
#include "core/XdiErrors.hpp"

using namespace xdi;

class PlaceholderRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        document = Json::parse(R"({
            "uid": "abc",
            "time": 0,
            "scan_id": 7,
            "flag": true,
            "plan": {"name": "count"},
            "md": {"XDI": {"Element_symbol": "Cu"}, "edge": "K"},
            "data": {"det": [1.234], "I0": [2]}
        })");
    }

    Json document;
};

TEST_F(PlaceholderRendererTest, NestedLookups) {
    EXPECT_EQ(PlaceholderRenderer::render("{md[XDI][Element_symbol]}", document).text, "Cu");
    EXPECT_EQ(PlaceholderRenderer::render("{plan.name}", document).text, "count");
    EXPECT_EQ(PlaceholderRenderer::render("{data[det][0]}", document).text, "1.234");
    EXPECT_EQ(PlaceholderRenderer::render("{md[XDI][Element_symbol]}_{md[edge]}", document).text, "Cu_K");
}

TEST_F(PlaceholderRendererTest, ScalarsUsePythonText) {
    EXPECT_EQ(PlaceholderRenderer::render("{scan_id}", document).text, "7");
    EXPECT_EQ(PlaceholderRenderer::render("{flag}", document).text, "True");
    EXPECT_EQ(PlaceholderRenderer::render("{uid!r}", document).text, "'abc'");
}

TEST_F(PlaceholderRendererTest, FormatSpecifiers) {
    EXPECT_EQ(PlaceholderRenderer::render("{data[det][0]:.2f}", document).text, "1.23");
    EXPECT_EQ(PlaceholderRenderer::render("{scan_id:03d}", document).text, "007");
    EXPECT_EQ(PlaceholderRenderer::render("{time:%Y-%m-%d}", document).text, "1970-01-01");
}

TEST_F(PlaceholderRendererTest, EscapedBraces) {
    EXPECT_EQ(PlaceholderRenderer::render("{{literal}} {uid}", document).text, "{literal} abc");
}

TEST_F(PlaceholderRendererTest, MissingPathIsUnresolved) {
    RenderResult result = PlaceholderRenderer::render("{md[sample]}", document);
    EXPECT_FALSE(result.resolved());
    EXPECT_EQ(result.missing_reference, "md[sample]");

    EXPECT_FALSE(PlaceholderRenderer::render("{data[det][3]}", document).resolved());
    EXPECT_FALSE(PlaceholderRenderer::render("{stop_reason}", document).resolved());
}

TEST_F(PlaceholderRendererTest, TemplateWithoutFieldsAlwaysResolves) {
    EXPECT_EQ(PlaceholderRenderer::render("constant", Json::object()).text, "constant");
    EXPECT_EQ(PlaceholderRenderer::render("", Json::object()).text, "");
}

TEST_F(PlaceholderRendererTest, MalformedTemplatesThrow) {
    EXPECT_THROW(PlaceholderRenderer::render("{uid", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("uid}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{0}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{uid!x}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{md[}", document), RenderError);
}

TEST_F(PlaceholderRendererTest, WrongTypedValuesThrow) {
    EXPECT_THROW(PlaceholderRenderer::render("{md[edge]:.2f}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{data[det][x]}", document), RenderError);
    EXPECT_THROW(PlaceholderRenderer::render("{uid[0]}", document), RenderError);
}

TEST_F(PlaceholderRendererTest, RenderRequiredNamesContext) {
    EXPECT_EQ(PlaceholderRenderer::render_required("{uid}-", document, "file prefix"), "abc-");
    try {
        PlaceholderRenderer::render_required("{sample}-", document, "file prefix");
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_NE(std::string(e.what()).find("file prefix"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("sample"), std::string::npos);
    }
}

TEST_F(PlaceholderRendererTest, References) {
    std::vector<std::string> names = PlaceholderRenderer::references("{a} and {b[c]:.2f} {{x}}");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "b[c]");
}
