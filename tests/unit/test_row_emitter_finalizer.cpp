/**
 * @file test_row_emitter_finalizer.cpp
 * @brief Unit tests for row rendering, header block rendering and the header rewrite
 */

#include <gtest/gtest.h>
#include "core/HeaderResolver.hpp"
#include "core/XdiErrors.hpp"
#include "export/Finalizer.hpp"
#include "export/MemoryBufferManager.hpp"
#include "export/RowEmitter.hpp"

using namespace xdi;

namespace {

const char* const ROW_TEMPLATE = R"(
[versions]
"XDI" = "# XDI/1.0 test"
"Extra" = "# extra"

[columns]
"Column.1" = {column_label="energy", data_key="energy", column_data="{data[energy][0]:.1f}", units="eV"}
"Column.2" = {column_label="mutrans", data_key="det", column_data="{data[det][0]:.3}"}
"Column.3" = {column_label="i0", data_key="det", column_data="{data[det][0]:.5}"}

[required_headers]
"Element.symbol" = {data="{md[XDI][Element_symbol]}"}

[optional_headers]
"Sample.name" = {data="{sample}"}
)";

Json record(double energy, double det) {
    Json body = Json::object();
    body["data"] = Json::object();
    body["data"]["energy"] = Json::array({energy});
    body["data"]["det"] = Json::array({det});
    return body;
}

} // namespace

class RowEmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        xdi_template = std::make_shared<const XdiTemplate>(TemplateLoader::from_text(ROW_TEMPLATE));
    }

    std::shared_ptr<const XdiTemplate> xdi_template;
};

TEST_F(RowEmitterTest, RendersColumnsInOrderTabSeparated) {
    RowEmitter emitter(xdi_template);
    EXPECT_EQ(emitter.render_row(record(8979.0, 0.123456)), "8979.0\t0.123\t0.12346\n");
}

TEST_F(RowEmitterTest, EligibilityNeedsEveryColumnKey) {
    RowEmitter emitter(xdi_template);
    EXPECT_EQ(emitter.required_data_keys(), (std::set<std::string>{"det", "energy"}));
    EXPECT_TRUE(emitter.is_eligible({"det", "energy"}));
    EXPECT_TRUE(emitter.is_eligible({"det", "energy", "motor"}));
    EXPECT_FALSE(emitter.is_eligible({"det"}));
    EXPECT_FALSE(emitter.is_eligible({}));
}

TEST_F(RowEmitterTest, MissingColumnValueIsRenderError) {
    RowEmitter emitter(xdi_template);
    Json incomplete = record(1.0, 2.0);
    incomplete["data"].erase("det");

    try {
        emitter.render_row(incomplete);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_NE(std::string(e.what()).find("det"), std::string::npos) << e.what();
    }
}

TEST_F(RowEmitterTest, RowsThatWouldNotSurviveTheRewriteAreRejected) {
    auto text_template = std::make_shared<const XdiTemplate>(TemplateLoader::from_text(R"(
[versions]
"XDI" = "# XDI/1.0"
[columns]
"Column.1" = {column_label="sample", data_key="s", column_data="{data[s][0]}"}
"Column.2" = {column_label="det", data_key="det", column_data="{data[det][0]}"}
[required_headers]
[optional_headers]
)"));
    RowEmitter emitter(text_template);

    auto text_record = [](const std::string& sample) {
        return Json::object({{"data", Json::object({{"s", Json::array({sample})}, {"det", Json::array({1})}})}});
    };

    EXPECT_EQ(emitter.render_row(text_record("sample-3#a")), "sample-3#a\t1\n");
    EXPECT_THROW(emitter.render_row(text_record("#sample-3")), RenderError);
    EXPECT_THROW(emitter.render_row(text_record("a\nb")), RenderError);
    EXPECT_THROW(emitter.render_row(text_record("a\rb")), RenderError);
}

TEST_F(RowEmitterTest, NullTemplateIsConfigError) {
    EXPECT_THROW(RowEmitter emitter(nullptr), ConfigError);
}

class FinalizerTest : public RowEmitterTest {
protected:
    void SetUp() override {
        RowEmitterTest::SetUp();
        resolver.initialize(xdi_template, Json::parse(R"({"uid": "r1", "time": 0, "md": {}})"));
    }

    HeaderResolver resolver;
};

TEST_F(FinalizerTest, HeaderBlockLayout) {
    std::string block = Finalizer::render_header_block(resolver.buffer(), *xdi_template);

    EXPECT_EQ(block,
              "# XDI/1.0 test\n"
              "# Extra = # extra\n"
              "# Column.1 = energy eV\n"
              "# Column.2 = mutrans\n"
              "# Column.3 = i0\n"
              "# Element.symbol = None\n"
              "# Sample.name = None\n"
              "#----\n"
              "# energy\tmutrans\ti0\n");
}

TEST_F(FinalizerTest, RewriteReplacesHeaderAndKeepsRows) {
    MemoryBufferManager manager;
    std::ostream& out = manager.open("stream_data", "run.xdi", OpenMode::EXCLUSIVE_CREATE);
    out << Finalizer::render_header_block(resolver.buffer(), *xdi_template);
    out << "1.0\t2.000\t2.0000\n";
    out << "\n";
    out << "3.0\t4.000\t4.0000";

    resolver.update(DocumentKind::DESCRIPTOR, Json::parse(R"({"md": {"XDI": {"Element_symbol": "Cu"}}})"));
    std::string final_block = Finalizer::render_header_block(resolver.buffer(), *xdi_template);

    size_t rows = Finalizer::rewrite(manager, "run.xdi", final_block);

    EXPECT_EQ(rows, 3u);
    EXPECT_EQ(manager.contents("run.xdi"), final_block + "1.0\t2.000\t2.0000\n\n3.0\t4.000\t4.0000");
    EXPECT_NE(manager.contents("run.xdi").find("# Element.symbol = Cu\n"), std::string::npos);
}

TEST_F(FinalizerTest, RewriteIsIdempotent) {
    MemoryBufferManager manager;
    std::ostream& out = manager.open("stream_data", "run.xdi", OpenMode::EXCLUSIVE_CREATE);
    std::string block = Finalizer::render_header_block(resolver.buffer(), *xdi_template);
    out << block << "1\t2\t3\n4\t5\t6\n";

    Finalizer::rewrite(manager, "run.xdi", block);
    std::string once = manager.contents("run.xdi");
    Finalizer::rewrite(manager, "run.xdi", block);

    EXPECT_EQ(manager.contents("run.xdi"), once);
    EXPECT_EQ(once, block + "1\t2\t3\n4\t5\t6\n");
}

TEST(FinalizerHeaderLineTest, OnlyHashPrefixedLinesAreHeader) {
    EXPECT_TRUE(Finalizer::is_header_line("# XDI/1.0"));
    EXPECT_TRUE(Finalizer::is_header_line("#----\n"));
    EXPECT_FALSE(Finalizer::is_header_line("1.0\t2.0\n"));
    EXPECT_FALSE(Finalizer::is_header_line(" # indented"));
    EXPECT_FALSE(Finalizer::is_header_line(""));
}
