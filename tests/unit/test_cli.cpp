/**
 * @file test_cli.cpp
 * @brief Tests for argument parsing, the document stream reader and the export orchestrator
 */

#include <gtest/gtest.h>
#include "cli/CommandLineInterface.hpp"
#include "cli/DocumentStreamReader.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "core/Logger.hpp"
#include "core/XdiErrors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace xdi;

namespace {

const std::string DATA_DIR = XDI_TEST_DATA_DIR;

/**
 * @brief Owns argv storage for parse_arguments()
 */
class Arguments {
public:
    Arguments(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "xdi-export");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

std::string slurp(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace

// ============================================================================
// CommandLineInterface
// ============================================================================

class CommandLineInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("XDI_LOG_LEVEL");
        unsetenv("XDI_LOG_FILE");
    }

    void TearDown() override {
        Logger::setDefaultLogFile(std::nullopt);
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
};

TEST_F(CommandLineInterfaceTest, ParsesOptions) {
    Arguments args{"--input", "run.jsonl", "-o", "out", "--file-prefix={scan_id}", "-c", "template.toml", "--summary"};
    CommandLineInterface cli;

    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));
    const CliOptions& options = cli.get_options();
    EXPECT_EQ(options.input, "run.jsonl");
    EXPECT_EQ(options.output_dir, "out");
    EXPECT_EQ(options.file_prefix, "{scan_id}");
    EXPECT_EQ(options.config, std::optional<std::string>("template.toml"));
    EXPECT_TRUE(options.summary);
    EXPECT_FALSE(cli.exit_requested());
}

TEST_F(CommandLineInterfaceTest, DefaultsAndStdin) {
    Arguments args{"-i", "-"};
    CommandLineInterface cli;

    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.get_options().input, "-");
    EXPECT_EQ(cli.get_options().output_dir, ".");
    EXPECT_EQ(cli.get_options().file_prefix, "{uid}-");
    EXPECT_FALSE(cli.get_options().config.has_value());
    EXPECT_FALSE(cli.get_options().summary);
}

TEST_F(CommandLineInterfaceTest, MissingInputIsAnError) {
    Arguments args{"--output-dir", "out"};
    CommandLineInterface cli;

    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_FALSE(cli.exit_requested());
}

TEST_F(CommandLineInterfaceTest, UnknownOptionIsAnError) {
    Arguments args{"--input", "run.jsonl", "--frobnicate"};
    CommandLineInterface cli;

    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_FALSE(cli.exit_requested());
}

TEST_F(CommandLineInterfaceTest, HelpAndVersionRequestExit) {
    Arguments help{"--help"};
    CommandLineInterface help_cli;
    EXPECT_FALSE(help_cli.parse_arguments(help.argc(), help.argv()));
    EXPECT_TRUE(help_cli.exit_requested());

    Arguments version{"--version"};
    CommandLineInterface version_cli;
    EXPECT_FALSE(version_cli.parse_arguments(version.argc(), version.argv()));
    EXPECT_TRUE(version_cli.exit_requested());
}

TEST_F(CommandLineInterfaceTest, LoggingOptions) {
    Arguments args{"-i", "run.jsonl", "--log-level", "4", "--log-config", "Serializer=6"};
    CommandLineInterface cli;

    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(Logger::getFacilityLevel("Finalizer"), LogLevel::DETAILED);
    EXPECT_EQ(Logger::getFacilityLevel("Serializer"), LogLevel::TRACE);

    Arguments bad{"-i", "run.jsonl", "--log-level", "Serializer=6"};
    CommandLineInterface bad_cli;
    EXPECT_FALSE(bad_cli.parse_arguments(bad.argc(), bad.argv()));
}

// ============================================================================
// DocumentStreamReader
// ============================================================================

TEST(DocumentStreamReaderTest, ReadsDocumentsAndSkipsBlankLines) {
    std::istringstream input(
        "[\"start\", {\"uid\": \"r1\", \"time\": 0}]\n"
        "\n"
        "   \n"
        "[\"stop\", {\"time\": 1}]\n");
    DocumentStreamReader reader(input, "stream");

    auto first = reader.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, "start");
    EXPECT_EQ(first->second["uid"], "r1");

    auto second = reader.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->first, "stop");
    EXPECT_EQ(reader.line_number(), 4u);

    EXPECT_FALSE(reader.next().has_value());
    EXPECT_EQ(reader.documents_read(), 2u);
}

TEST(DocumentStreamReaderTest, MalformedLinesNameTheirLocation) {
    std::istringstream input("[\"start\", {\"uid\": \"r1\", \"time\": 0}]\n{\"not\": \"a pair\"}\n");
    DocumentStreamReader reader(input, "stream.jsonl");
    reader.next();

    try {
        reader.next();
        FAIL() << "expected DocumentError";
    } catch (const DocumentError& e) {
        EXPECT_NE(std::string(e.what()).find("stream.jsonl:2"), std::string::npos) << e.what();
    }

    EXPECT_THROW(DocumentStreamReader::parse_line("[\"start\", ", "here"), DocumentError);
    EXPECT_THROW(DocumentStreamReader::parse_line("[\"start\", []]", "here"), DocumentError);
    EXPECT_THROW(DocumentStreamReader::parse_line("[1, {}]", "here"), DocumentError);
}

// ============================================================================
// ExportOrchestrator
// ============================================================================

class ExportOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        output_dir = std::filesystem::temp_directory_path() / (std::string("xdi_orchestrator_") + info->name());
        std::filesystem::remove_all(output_dir);

        options.input = DATA_DIR + "/run.jsonl";
        options.output_dir = output_dir.string();
        options.config = DATA_DIR + "/xdi_template.toml";
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir);
    }

    std::filesystem::path output_dir;
    CliOptions options;
};

TEST_F(ExportOrchestratorTest, ExportsSampleRun) {
    std::ostringstream out;
    ExportOrchestrator orchestrator(options, out);

    ASSERT_TRUE(orchestrator.export_stream());

    std::string expected_path = (output_dir / "run-0001-.xdi").string();
    EXPECT_EQ(out.str(), expected_path + "\n");
    EXPECT_EQ(slurp(expected_path),
              "# XDI/1.0 xdi-export/1.0\n"
              "# Column.1 = energy eV\n"
              "# Column.2 = i0\n"
              "# Element.symbol = Cu\n"
              "# Element.edge = K\n"
              "# Facility.name = Test Light Source\n"
              "# Beamline.focusing = toroidal mirror\n"
              "# Scan.start_time = 1970-01-01T00:00:00\n"
              "# Scan.end_time = 1970-01-01T00:01:00\n"
              "#----\n"
              "# energy\ti0\n"
              "8979.00\t1000\n"
              "8980.50\t1001\n"
              "8982.25\t1002\n");

    const auto& stages = orchestrator.get_output_tracker().getStages();
    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages[0].stage_data.at("documents"), "6");
    EXPECT_EQ(stages[0].stage_data.at("rows"), "3");
    EXPECT_EQ(stages[0].stage_data.at("diagnostics"), "0");
}

TEST_F(ExportOrchestratorTest, SummaryIsPrinted) {
    options.summary = true;
    std::ostringstream out;
    ExportOrchestrator orchestrator(options, out);

    ASSERT_TRUE(orchestrator.export_stream());
    EXPECT_NE(out.str().find("=== Export Summary ==="), std::string::npos) << out.str();
    EXPECT_EQ(orchestrator.get_output_tracker().getTrackedFileCount(), 1u);
}

TEST_F(ExportOrchestratorTest, FailuresReturnFalse) {
    std::ostringstream out;

    CliOptions missing = options;
    missing.input = (output_dir / "absent.jsonl").string();
    EXPECT_FALSE(ExportOrchestrator(missing, out).export_stream());

    std::istringstream out_of_order("[\"stop\", {\"time\": 1}]\n");
    EXPECT_FALSE(ExportOrchestrator(options, out).export_stream(out_of_order, "<test>"));

    CliOptions bad_template = options;
    bad_template.config = (output_dir / "absent.toml").string();
    std::istringstream start_only("[\"start\", {\"uid\": \"r2\", \"time\": 0}]\n");
    EXPECT_FALSE(ExportOrchestrator(bad_template, out).export_stream(start_only, "<test>"));
}
