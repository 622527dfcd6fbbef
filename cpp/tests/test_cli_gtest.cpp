// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "qrpolicy/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace qrpolicy::cli::test {

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
// --help / --version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"qrpolicy", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_SubcommandHelp) {
    Args args{"qrpolicy", "check", "-h"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "check");
}

TEST(CliTest, Parse_HelpCommandWithName) {
    Args args{"qrpolicy", "help", "add"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "add");
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"qrpolicy", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, Parse_NoArguments_PrintsHelpWithExitCode2) {
    Args args{"qrpolicy"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: qrpolicy"), std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions) {
    // Arrange
    Args args{"qrpolicy", "-q", "--no-color", "--policy-dir", "/tmp/policy.d", "list"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.quiet);
    EXPECT_TRUE(result.global.no_color);
    EXPECT_EQ(result.global.policy_dir, std::filesystem::path("/tmp/policy.d"));
    EXPECT_TRUE(std::holds_alternative<ListCommand>(result.command));
}

TEST(CliTest, Parse_DefaultPolicyDir) {
    Args args{"qrpolicy", "list"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.policy_dir, std::filesystem::path(DEFAULT_POLICY_DIR));
}

TEST(CliTest, Parse_VerboseAfterSubcommand) {
    Args args{"qrpolicy", "-v", "lint", "-vv"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 3);
}

TEST(CliTest, Parse_PolicyDirEqualsForm) {
    Args args{"qrpolicy", "--policy-dir=/srv/policy", "list"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.policy_dir, std::filesystem::path("/srv/policy"));
}

// ==============================================================================
// lint / check
// ==============================================================================

TEST(CliTest, Parse_Lint) {
    Args args{"qrpolicy", "lint", "--json", "-o", "report.json", "30-user", "include/admin-ro"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<LintCommand>(result.command);
    EXPECT_TRUE(cmd.json);
    ASSERT_TRUE(cmd.output.has_value());
    EXPECT_EQ(*cmd.output, std::filesystem::path("report.json"));
    EXPECT_EQ(cmd.names, (std::vector<std::string>{"30-user", "include/admin-ro"}));
}

TEST(CliTest, Parse_Check) {
    Args args{"qrpolicy", "check",   "--service", "qubes.Filecopy", "--source=work",
              "--argument", "+anything", "--qubes", "qubes.yaml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<CheckCommand>(result.command);
    EXPECT_EQ(cmd.service, "qubes.Filecopy");
    EXPECT_EQ(cmd.source, "work");
    EXPECT_EQ(cmd.argument, "anything");
    EXPECT_FALSE(cmd.target.has_value());
    EXPECT_EQ(cmd.qubes.value_or(""), std::filesystem::path("qubes.yaml"));
    EXPECT_FALSE(cmd.json);
}

TEST(CliTest, Parse_Check_MissingRequired) {
    Args args{"qrpolicy", "check", "--target", "vault"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    const auto& msg = result.diagnostic.stderr_message;
    EXPECT_NE(msg.find("the following required arguments were not provided"), std::string::npos);
    EXPECT_NE(msg.find("--service <SERVICE>"), std::string::npos);
    EXPECT_NE(msg.find("--source <SOURCE>"), std::string::npos);
}

TEST(CliTest, Parse_Check_MissingValue) {
    Args args{"qrpolicy", "check", "--source", "work", "--service"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required for '--service"),
              std::string::npos);
}

// ==============================================================================
// Команды редактирования
// ==============================================================================

TEST(CliTest, Parse_Add) {
    Args args{"qrpolicy", "add", "--at", "2", "30-user", "qubes.Filecopy", "*",
              "work",     "@default", "ask", "default_target=vault"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<AddCommand>(result.command);
    EXPECT_EQ(cmd.name, "30-user");
    EXPECT_EQ(cmd.at.value_or(0), 2u);
    ASSERT_EQ(cmd.tokens.size(), 6u);
    EXPECT_EQ(cmd.tokens.front(), "qubes.Filecopy");
    EXPECT_EQ(cmd.tokens.back(), "default_target=vault");
}

TEST(CliTest, Parse_Add_MissingTokens) {
    Args args{"qrpolicy", "add", "30-user"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<TOKEN>..."), std::string::npos);
}

TEST(CliTest, Parse_RemoveMoveSet) {
    Args remove_args{"qrpolicy", "remove", "30-user", "3"};
    Args move_args{"qrpolicy", "move", "30-user", "3", "1"};
    Args set_args{"qrpolicy", "set", "30-user", "2", "destination", "@dispvm"};

    auto remove = parse(remove_args.argc(), remove_args.argv());
    auto move = parse(move_args.argc(), move_args.argv());
    auto set = parse(set_args.argc(), set_args.argv());

    ASSERT_TRUE(remove.ok);
    EXPECT_EQ(std::get<RemoveCommand>(remove.command).line, 3u);
    ASSERT_TRUE(move.ok);
    EXPECT_EQ(std::get<MoveCommand>(move.command).from, 3u);
    EXPECT_EQ(std::get<MoveCommand>(move.command).to, 1u);
    ASSERT_TRUE(set.ok);
    const auto& set_cmd = std::get<SetCommand>(set.command);
    EXPECT_EQ(set_cmd.line, 2u);
    EXPECT_EQ(set_cmd.field, "destination");
    EXPECT_EQ(set_cmd.value, "@dispvm");
}

TEST(CliTest, Parse_InvalidLineNumber) {
    Args args{"qrpolicy", "remove", "30-user", "0"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("invalid value '0' for '<LINE>'"),
              std::string::npos);
}

TEST(CliTest, Parse_TooManyArguments) {
    Args args{"qrpolicy", "show", "30-user", "extra"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'extra'"),
              std::string::npos);
}

TEST(CliTest, Parse_New) {
    Args args{"qrpolicy", "new", "40-new"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<NewCommand>(result.command).name, "40-new");
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(CliTest, Parse_UnknownCommand) {
    Args args{"qrpolicy", "frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'frobnicate'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownOption) {
    Args args{"qrpolicy", "lint", "--fast"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--fast' found"),
              std::string::npos);
}

// ==============================================================================
// Справка и номера строк
// ==============================================================================

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), "qrpolicy 0.3.0\n");
}

TEST(CliTest, RenderHelp_ListsCommands) {
    const std::string help = render_help();

    for (const char* cmd : {"lint", "check", "list", "show", "add", "remove", "move", "set", "new"}) {
        EXPECT_NE(help.find(std::string("  ") + cmd + " "), std::string::npos) << cmd;
    }
    EXPECT_NE(render_help(std::string("check")).find("--service <SERVICE>"), std::string::npos);
}

TEST(CliTest, ParseLineNumber) {
    EXPECT_EQ(parse_line_number("1").value_or(0), 1u);
    EXPECT_EQ(parse_line_number("42").value_or(0), 42u);
    EXPECT_FALSE(parse_line_number("0").has_value());
    EXPECT_FALSE(parse_line_number("-1").has_value());
    EXPECT_FALSE(parse_line_number("1a").has_value());
    EXPECT_FALSE(parse_line_number("").has_value());
    EXPECT_FALSE(parse_line_number("1234567890").has_value());
}

}  // namespace qrpolicy::cli::test
