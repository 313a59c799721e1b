/**
 * @file test_header_resolver.cpp
 * @brief Unit tests for incremental header resolution
 */

#include <gtest/gtest.h>
#include "core/HeaderResolver.hpp"
#include "core/TimeFormat.hpp"
#include "core/XdiErrors.hpp"

using namespace xdi;

namespace {

const char* const RESOLVER_TEMPLATE = R"(
[versions]
"XDI" = "# XDI/1.0"

[columns]
"Column.1" = {column_label="energy", data_key="det", column_data="{data[det][0]}", units="eV"}
"Column.2" = {column_label="{md[detector_name]}", data_key="I0", column_data="{data[I0][0]}"}

[required_headers]
"Element.symbol" = {data="{md[XDI][Element_symbol]}"}
"Element.edge" = {data="{md[XDI][Element_edge]}"}

[optional_headers]
"Sample.name" = {data="{sample}"}
"Scan.start_time" = {data="{md[custom_start]}"}
"Scan.end_time" = {data="{time}"}
)";

} // namespace

class HeaderResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        xdi_template = std::make_shared<const XdiTemplate>(TemplateLoader::from_text(RESOLVER_TEMPLATE));
        start = Json::parse(R"({
            "uid": "r1", "time": 1000.0,
            "md": {"XDI": {"Element_symbol": "Cu"}, "custom_start": "yesterday"}
        })");
    }

    std::shared_ptr<const XdiTemplate> xdi_template;
    Json start;
};

TEST_F(HeaderResolverTest, InitializeSeedsFieldsInTemplateOrder) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);

    const auto& lines = resolver.buffer().lines();
    ASSERT_EQ(lines.size(), 8u);

    std::vector<std::string> names;
    for (const auto& line : lines) names.push_back(line.name);
    EXPECT_EQ(names, xdi_template->field_names());

    EXPECT_EQ(lines[0].section, HeaderSection::VERSIONS);
    EXPECT_EQ(lines[1].section, HeaderSection::COLUMNS);
    EXPECT_EQ(lines[3].section, HeaderSection::REQUIRED);
    EXPECT_EQ(lines[5].section, HeaderSection::OPTIONAL);
}

TEST_F(HeaderResolverTest, InitializeResolvesWhatTheStartDocumentHas) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);
    const HeaderLineBuffer& buffer = resolver.buffer();

    EXPECT_EQ(buffer.value_or_none("XDI"), "# XDI/1.0");
    EXPECT_EQ(buffer.value_or_none("Column.1"), "energy eV");
    EXPECT_EQ(buffer.value_or_none("Column.2"), "None");
    EXPECT_EQ(buffer.value_or_none("Element.symbol"), "Cu");
    EXPECT_EQ(buffer.value_or_none("Element.edge"), "None");
    EXPECT_EQ(buffer.unresolved_count(), 4u);
}

TEST_F(HeaderResolverTest, TimestampFieldsIgnoreTheirTemplates) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);

    EXPECT_EQ(resolver.buffer().value_or_none("Scan.start_time"), format_iso8601(1000.0));
    EXPECT_EQ(resolver.buffer().value_or_none("Scan.start_time"), "1970-01-01T00:16:40");
    EXPECT_FALSE(resolver.buffer().find("Scan.end_time")->value.has_value());

    // A descriptor carrying "time" does not resolve Scan.end_time
    resolver.update(DocumentKind::DESCRIPTOR, Json::parse(R"({"uid": "d1", "time": 1001.0, "data_keys": {}})"));
    EXPECT_FALSE(resolver.buffer().find("Scan.end_time")->value.has_value());

    resolver.update(DocumentKind::STOP, Json::parse(R"({"time": 1060.0})"));
    EXPECT_EQ(resolver.buffer().value_or_none("Scan.end_time"), "1970-01-01T00:17:40");
}

TEST_F(HeaderResolverTest, LaterDocumentsFillDeferredFields) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);

    size_t resolved = resolver.update(DocumentKind::DESCRIPTOR, Json::parse(R"({
        "uid": "d1", "data_keys": {},
        "md": {"XDI": {"Element_edge": "K"}, "detector_name": "ion chamber"}
    })"));

    EXPECT_EQ(resolved, 2u);
    EXPECT_EQ(resolver.buffer().value_or_none("Element.edge"), "K");
    EXPECT_EQ(resolver.buffer().value_or_none("Column.2"), "ion chamber");
    EXPECT_TRUE(resolver.unresolved_required().empty());
}

TEST_F(HeaderResolverTest, FirstResolutionWins) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);

    resolver.update(DocumentKind::DESCRIPTOR,
                    Json::parse(R"({"md": {"XDI": {"Element_symbol": "Zn", "Element_edge": "K"}}})"));
    resolver.update(DocumentKind::DESCRIPTOR,
                    Json::parse(R"({"md": {"XDI": {"Element_symbol": "Fe", "Element_edge": "L3"}}})"));

    EXPECT_EQ(resolver.buffer().value_or_none("Element.symbol"), "Cu");
    EXPECT_EQ(resolver.buffer().value_or_none("Element.edge"), "K");
}

TEST_F(HeaderResolverTest, UnresolvedRequiredAreListed) {
    HeaderResolver resolver;
    resolver.initialize(xdi_template, start);
    resolver.update(DocumentKind::STOP, Json::parse(R"({"time": 1060.0})"));

    EXPECT_EQ(resolver.unresolved_required(), std::vector<std::string>{"Element.edge"});
    EXPECT_EQ(resolver.buffer().value_or_none("Sample.name"), "None");
}

TEST_F(HeaderResolverTest, WrongTypedValueNamesTheField) {
    auto typed = std::make_shared<const XdiTemplate>(TemplateLoader::from_text(R"(
[versions]
"XDI" = "# XDI/1.0"
[columns]
"Column.1" = {column_label="energy", data_key="det", column_data="{data[det][0]}"}
[required_headers]
"Element.symbol" = {data="{md[XDI][Element_symbol]:.2f}"}
[optional_headers]
)"));

    HeaderResolver resolver;
    try {
        resolver.initialize(typed, start);
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        EXPECT_NE(std::string(e.what()).find("header field 'Element.symbol'"), std::string::npos) << e.what();
    }
}

TEST_F(HeaderResolverTest, UpdateBeforeInitializeIsSequenceError) {
    HeaderResolver resolver;
    EXPECT_THROW(resolver.update(DocumentKind::EVENT, Json::object()), SequenceError);
}

TEST(HeaderLineBufferTest, ResolveKeepsFirstValue) {
    HeaderLineBuffer buffer;
    buffer.append("A", HeaderSection::OPTIONAL);

    EXPECT_TRUE(buffer.resolve("A", "one"));
    EXPECT_FALSE(buffer.resolve("A", "two"));
    EXPECT_FALSE(buffer.resolve("missing", "x"));
    EXPECT_EQ(buffer.value_or_none("A"), "one");
    EXPECT_EQ(buffer.value_or_none("missing"), "None");
    EXPECT_EQ(buffer.unresolved_count(), 0u);
}
