// ==============================================================================
// test_cli_basic.cpp - Базовые тесты CLI
// ==============================================================================
//
// Минимальная проверка сборки и работоспособности без GoogleTest.
//
// ==============================================================================

#include "qrpolicy/cli.hpp"

#include <cassert>
#include <cstring>
#include <iostream>

namespace {

// Вспомогательная функция для создания argv
std::vector<char*> make_argv(std::initializer_list<const char*> args) {
    std::vector<char*> result;
    for (const char* arg : args) {
        result.push_back(const_cast<char*>(arg));
    }
    return result;
}

void test_help_command() {
    std::cout << "Testing --help parsing... ";

    auto argv = make_argv({"qrpolicy", "--help"});
    auto result = qrpolicy::cli::parse(static_cast<int>(argv.size()), argv.data());

    assert(result.ok && "Parse should succeed");
    assert(std::holds_alternative<qrpolicy::cli::HelpCommand>(result.command) &&
           "Command should be HelpCommand");
    (void)result;

    std::cout << "PASS\n";
}

void test_lint_command() {
    std::cout << "Testing lint command parsing... ";

    auto argv = make_argv({"qrpolicy", "lint", "30-user"});
    auto result = qrpolicy::cli::parse(static_cast<int>(argv.size()), argv.data());

    assert(result.ok && "Parse should succeed");
    assert(std::holds_alternative<qrpolicy::cli::LintCommand>(result.command) &&
           "Command should be LintCommand");

    [[maybe_unused]] const auto& cmd = std::get<qrpolicy::cli::LintCommand>(result.command);
    assert(cmd.names.size() == 1 && cmd.names[0] == "30-user" && "Name should match input");

    std::cout << "PASS\n";
}

void test_unknown_command() {
    std::cout << "Testing unknown command error... ";

    auto argv = make_argv({"qrpolicy", "unknown_cmd"});
    auto result = qrpolicy::cli::parse(static_cast<int>(argv.size()), argv.data());

    assert(!result.ok && "Parse should fail for unknown command");
    assert(result.diagnostic.exit_code == 2 && "Exit code should be 2");
    assert(!result.diagnostic.stderr_message.empty() && "Error message should not be empty");
    (void)result;

    std::cout << "PASS\n";
}

void test_version_string() {
    std::cout << "Testing version string... ";

    [[maybe_unused]] const std::string version = qrpolicy::cli::render_version();
    assert(version.find("qrpolicy") != std::string::npos && "Version should contain name");
    assert(version.find(qrpolicy::cli::VERSION) != std::string::npos &&
           "Version should contain version number");

    std::cout << "PASS\n";
}

}  // anonymous namespace

int main() {
    std::cout << "=== qrpolicy CLI Basic Tests ===\n\n";

    test_help_command();
    test_lint_command();
    test_unknown_command();
    test_version_string();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
