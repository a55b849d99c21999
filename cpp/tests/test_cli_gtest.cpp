// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "indexlens/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace indexlens::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"indexlens", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_HelpSubcommand_CarriesName) {
    Args args{"indexlens", "help", "prep"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, "prep");
}

TEST(CliTest, Parse_SubcommandHelp_CarriesName) {
    Args args{"indexlens", "parse", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, "parse");
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"indexlens", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion_Golden) {
    EXPECT_EQ(render_version(), "indexlens 0.1.0\n");
}

TEST(CliTest, RenderHelp_Main_ContainsCommands) {
    std::string help = render_help();

    EXPECT_NE(help.find("Usage: indexlens [OPTIONS] <COMMAND>"), std::string::npos);
    EXPECT_NE(help.find("  parse  "), std::string::npos);
    EXPECT_NE(help.find("  prep   "), std::string::npos);
    EXPECT_NE(help.find("--num-threads"), std::string::npos);
}

TEST(CliTest, RenderHelp_Prep_ContainsBulkOptions) {
    std::string help = render_help(std::string("prep"));

    EXPECT_NE(help.find("--bulk <BULK>"), std::string::npos);
    EXPECT_NE(help.find("[env: ES_INDEX]"), std::string::npos);
    EXPECT_NE(help.find("--source-order"), std::string::npos);
}

TEST(CliTest, RenderHelp_Unknown_Error) {
    EXPECT_EQ(render_help(std::string("bogus")), "error: unrecognized subcommand 'bogus'\n");
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions) {
    Args args{"indexlens", "--no-banner", "-q", "-v", "-v", "--num-threads", "3", "parse", "a.b"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_EQ(result.global.num_threads, 3u);
}

TEST(CliTest, Parse_NumThreadsEquals) {
    Args args{"indexlens", "--num-threads=8", "parse", "a.b"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.num_threads, 8u);
}

TEST(CliTest, Parse_NumThreadsInvalid_Exit2) {
    Args args{"indexlens", "--num-threads", "many", "parse", "a.b"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("invalid value 'many'"), std::string::npos);
}

// ==============================================================================
// parse
// ==============================================================================

TEST(CliTest, Parse_ParseCommand_Identifiers) {
    Args args{"indexlens", "parse", "metrics.payments.prod", ".ds-logs-app-2024.01.15-000001",
              "--jsonl"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(std::holds_alternative<ParseCommand>(result.command));
    const auto& cmd = std::get<ParseCommand>(result.command);
    ASSERT_EQ(cmd.identifiers.size(), 2u);
    EXPECT_EQ(cmd.identifiers[1], ".ds-logs-app-2024.01.15-000001");
    EXPECT_TRUE(cmd.jsonl);
    EXPECT_FALSE(cmd.json);
}

TEST(CliTest, Parse_ParseCommand_ParserFlagsAndOutput) {
    Args args{"indexlens", "parse", "--stdin", "--source-order", "--literal-prefix",
              "--fallback-token-environment", "--structured-default-environment",
              "-o", "out.json", "--config=cfg.yaml", "-j"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<ParseCommand>(result.command);
    EXPECT_TRUE(cmd.from_stdin);
    EXPECT_TRUE(cmd.parser.source_order);
    EXPECT_TRUE(cmd.parser.literal_prefix);
    EXPECT_TRUE(cmd.parser.fallback_token_environment);
    EXPECT_TRUE(cmd.parser.structured_default_environment);
    ASSERT_TRUE(cmd.output.has_value());
    EXPECT_EQ(cmd.output->filename(), "out.json");
    ASSERT_TRUE(cmd.config.has_value());
    EXPECT_EQ(cmd.config->filename(), "cfg.yaml");
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_ParseCommand_DoubleDash_DashedIdentifier) {
    Args args{"indexlens", "parse", "--", "-weird-name"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<ParseCommand>(result.command);
    ASSERT_EQ(cmd.identifiers.size(), 1u);
    EXPECT_EQ(cmd.identifiers[0], "-weird-name");
}

TEST(CliTest, Parse_ParseCommand_NoInput_Exit2) {
    Args args{"indexlens", "parse"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("required arguments"), std::string::npos);
}

TEST(CliTest, Parse_ParseCommand_ConflictingFormats_Exit2) {
    Args args{"indexlens", "parse", "a.b", "--json", "--csv"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_ParseCommand_MissingOutputValue_Exit2) {
    Args args{"indexlens", "parse", "a.b", "-o"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: a value is required for '--output <OUTPUT>' but none was supplied\n\n"
              "Usage: indexlens parse [OPTIONS] [IDENTIFIER]...\n\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// prep
// ==============================================================================

TEST(CliTest, Parse_PrepCommand_AllOptions) {
    // Arrange
    Args args{"indexlens", "prep",   "reports/",   "extra.csv",       "-d",
              "tab",       "--bulk", "out.ndjson", "--es-index",      "index-metadata",
              "--skip-errors", "-o", "enriched.csv"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(std::holds_alternative<PrepCommand>(result.command));
    const auto& cmd = std::get<PrepCommand>(result.command);
    EXPECT_EQ(cmd.paths.size(), 2u);
    EXPECT_EQ(cmd.delimiter, '\t');
    ASSERT_TRUE(cmd.bulk.has_value());
    EXPECT_EQ(cmd.bulk->filename(), "out.ndjson");
    EXPECT_EQ(cmd.es_index, "index-metadata");
    EXPECT_TRUE(cmd.skip_errors);
    EXPECT_FALSE(cmd.json);
}

TEST(CliTest, Parse_PrepCommand_NoPaths_Exit2) {
    Args args{"indexlens", "prep", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PATH>..."), std::string::npos);
}

TEST(CliTest, Parse_PrepCommand_InvalidDelimiter_Exit2) {
    Args args{"indexlens", "prep", "r.csv", "--delimiter", ";;"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_PrepCommand_UnknownFlag_Exit2) {
    Args args{"indexlens", "prep", "r.csv", "--frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument '--frobnicate' "
                                                     "found",
                                                     0),
              0u);
}

// ==============================================================================
// Ошибки и exit codes
// ==============================================================================

TEST(CliTest, Parse_NoArgs_HelpWithExit2) {
    Args args{"indexlens"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message, render_help());
}

TEST(CliTest, Parse_UnknownCommand_Exit2) {
    Args args{"indexlens", "hunt"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'hunt'\n\n"
              "Usage: indexlens [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliTest, Parse_UnknownGlobalFlag_Exit2) {
    Args args{"indexlens", "--bogus"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

}  // namespace indexlens::cli::test
