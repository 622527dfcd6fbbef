// ==============================================================================
// cli.cpp - Разбор командной строки
// ==============================================================================
//
// Собственный разбор argv без сторонних библиотек: глобальные опции до
// подкоманды, затем опции и позиционные аргументы подкоманды. Ошибки
// разбора возвращаются как CliDiagnostic (exit code 2).
//
// ==============================================================================

#include "qrpolicy/cli.hpp"

#include "qrpolicy/platform.hpp"

#include <cstring>

namespace qrpolicy::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

std::string render_usage_error(const std::string& error_msg, std::string_view usage) {
    std::string out = error_msg;
    out += "\n\nUsage: ";
    out += usage;
    out += "\n\nFor more information, try '--help'.\n";
    return out;
}

/// Курсор по argv подкоманды
class Args {
public:
    Args(int argc, char** argv, int start) : argc_(argc), argv_(argv), pos_(start) {}

    bool done() const { return pos_ >= argc_; }
    const char* next() { return argv_[pos_++]; }

    /// Значение опции: "--opt VALUE" или "--opt=VALUE"
    /// @return nullptr, если значение не передано
    const char* value_of(const char* arg, const char* name) {
        const std::size_t n = std::strlen(name);
        if (std::strncmp(arg, name, n) == 0 && arg[n] == '=') {
            return arg + n + 1;
        }
        if (pos_ < argc_) {
            return argv_[pos_++];
        }
        return nullptr;
    }

private:
    int argc_;
    char** argv_;
    int pos_;
};

/// Совпадает ли arg с опцией (в том числе в форме --opt=VALUE)
bool is_option(const char* arg, const char* name) {
    const std::size_t n = std::strlen(name);
    return std::strncmp(arg, name, n) == 0 && (arg[n] == '\0' || arg[n] == '=');
}

/// -v, -vv, -vvv
int count_verbose(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int n = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++n;
    }
    return n;
}

/// Флаги, допустимые и после подкоманды
bool apply_global_flag(const char* arg, GlobalOptions& global) {
    if (int v = count_verbose(arg); v > 0) {
        global.verbose += v;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
        return true;
    }
    if (str_eq(arg, "--no-color")) {
        global.no_color = true;
        return true;
    }
    return false;
}

ParseResult fail(ParseResult& result, std::string message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = std::move(message);
    return result;
}

std::string missing_value(const char* option) {
    return std::string("error: a value is required for '") + option +
           "' but none was supplied\n\nFor more information, try '--help'.\n";
}

std::string unexpected_argument(const char* arg, std::string_view usage) {
    return render_usage_error(std::string("error: unexpected argument '") + arg + "' found",
                              usage);
}

std::string missing_arguments(const std::vector<std::string>& names, std::string_view usage) {
    std::string msg = "error: the following required arguments were not provided:";
    for (const auto& n : names) {
        msg += "\n  " + n;
    }
    return render_usage_error(msg, usage);
}

constexpr const char* USAGE_MAIN = "qrpolicy [OPTIONS] <COMMAND>";
constexpr const char* USAGE_LINT = "qrpolicy lint [OPTIONS] [NAME]...";
constexpr const char* USAGE_CHECK =
    "qrpolicy check [OPTIONS] --service <SERVICE> --source <SOURCE>";
constexpr const char* USAGE_SHOW = "qrpolicy show <NAME>";
constexpr const char* USAGE_ADD = "qrpolicy add [OPTIONS] <NAME> <TOKEN>...";
constexpr const char* USAGE_REMOVE = "qrpolicy remove <NAME> <LINE>";
constexpr const char* USAGE_MOVE = "qrpolicy move <NAME> <FROM> <TO>";
constexpr const char* USAGE_SET = "qrpolicy set <NAME> <LINE> <FIELD> <VALUE>";
constexpr const char* USAGE_NEW = "qrpolicy new <NAME>";

/// Собрать позиционные аргументы подкоманды (без собственных опций)
///
/// Возвращает false и заполняет result при ошибке.
bool collect_positionals(Args& args, ParseResult& result, const char* command,
                         std::string_view usage, std::vector<std::string>& out) {
    bool only_positional = false;
    while (!args.done()) {
        const char* arg = args.next();
        if (!only_positional) {
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{command};
                return false;
            }
            if (str_eq(arg, "--")) {
                only_positional = true;
                continue;
            }
            if (apply_global_flag(arg, result.global)) {
                continue;
            }
            if (arg[0] == '-' && arg[1] != '\0') {
                fail(result, unexpected_argument(arg, usage));
                return false;
            }
        }
        out.emplace_back(arg);
    }
    return true;
}

bool require_line(ParseResult& result, const std::string& text, const char* what,
                  std::size_t& out) {
    auto n = parse_line_number(text);
    if (!n) {
        fail(result, std::string("error: invalid value '") + text + "' for '<" + what +
                         ">': expected a line number starting at 1\n\n"
                         "For more information, try '--help'.\n");
        return false;
    }
    out = *n;
    return true;
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_lint(Args& args, ParseResult& result) {
    LintCommand cmd;
    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"lint"};
            return;
        } else if (apply_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "-o") || is_option(arg, "--output")) {
            const char* v = args.value_of(arg, "--output");
            if (v == nullptr) {
                fail(result, missing_value("--output <OUTPUT>"));
                return;
            }
            cmd.output = platform::path_from_utf8(v);
        } else if (arg[0] != '-') {
            cmd.names.emplace_back(arg);
        } else {
            fail(result, unexpected_argument(arg, USAGE_LINT));
            return;
        }
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_check(Args& args, ParseResult& result) {
    CheckCommand cmd;
    bool have_service = false;
    bool have_source = false;

    while (!args.done()) {
        const char* arg = args.next();
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"check"};
            return;
        } else if (apply_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (is_option(arg, "--service")) {
            const char* v = args.value_of(arg, "--service");
            if (v == nullptr) {
                fail(result, missing_value("--service <SERVICE>"));
                return;
            }
            cmd.service = v;
            have_service = true;
        } else if (is_option(arg, "--argument")) {
            const char* v = args.value_of(arg, "--argument");
            if (v == nullptr) {
                fail(result, missing_value("--argument <ARGUMENT>"));
                return;
            }
            // "+foo" и "foo" равнозначны
            cmd.argument = (v[0] == '+') ? v + 1 : v;
        } else if (is_option(arg, "--source")) {
            const char* v = args.value_of(arg, "--source");
            if (v == nullptr) {
                fail(result, missing_value("--source <SOURCE>"));
                return;
            }
            cmd.source = v;
            have_source = true;
        } else if (is_option(arg, "--target")) {
            const char* v = args.value_of(arg, "--target");
            if (v == nullptr) {
                fail(result, missing_value("--target <TARGET>"));
                return;
            }
            cmd.target = v;
        } else if (is_option(arg, "--qubes")) {
            const char* v = args.value_of(arg, "--qubes");
            if (v == nullptr) {
                fail(result, missing_value("--qubes <FILE>"));
                return;
            }
            cmd.qubes = platform::path_from_utf8(v);
        } else if (str_eq(arg, "-o") || is_option(arg, "--output")) {
            const char* v = args.value_of(arg, "--output");
            if (v == nullptr) {
                fail(result, missing_value("--output <OUTPUT>"));
                return;
            }
            cmd.output = platform::path_from_utf8(v);
        } else {
            fail(result, unexpected_argument(arg, USAGE_CHECK));
            return;
        }
    }

    std::vector<std::string> missing;
    if (!have_service) {
        missing.emplace_back("--service <SERVICE>");
    }
    if (!have_source) {
        missing.emplace_back("--source <SOURCE>");
    }
    if (!missing.empty()) {
        fail(result, missing_arguments(missing, USAGE_CHECK));
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

void parse_add(Args& args, ParseResult& result) {
    AddCommand cmd;
    std::vector<std::string> positionals;
    bool only_positional = false;

    while (!args.done()) {
        const char* arg = args.next();
        if (!only_positional) {
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{"add"};
                return;
            }
            if (str_eq(arg, "--")) {
                only_positional = true;
                continue;
            }
            if (apply_global_flag(arg, result.global)) {
                continue;
            }
            if (is_option(arg, "--at")) {
                const char* v = args.value_of(arg, "--at");
                if (v == nullptr) {
                    fail(result, missing_value("--at <LINE>"));
                    return;
                }
                std::size_t at = 0;
                if (!require_line(result, v, "LINE", at)) {
                    return;
                }
                cmd.at = at;
                continue;
            }
            if (arg[0] == '-' && arg[1] != '\0') {
                fail(result, unexpected_argument(arg, USAGE_ADD));
                return;
            }
        }
        positionals.emplace_back(arg);
    }

    if (positionals.size() < 2) {
        std::vector<std::string> missing;
        if (positionals.empty()) {
            missing.emplace_back("<NAME>");
        }
        missing.emplace_back("<TOKEN>...");
        fail(result, missing_arguments(missing, USAGE_ADD));
        return;
    }

    cmd.name = positionals.front();
    cmd.tokens.assign(positionals.begin() + 1, positionals.end());
    result.ok = true;
    result.command = std::move(cmd);
}

/// Подкоманды с фиксированным набором позиционных аргументов
void parse_fixed(Args& args, ParseResult& result, const char* command, std::string_view usage,
                 const std::vector<std::string>& names) {
    std::vector<std::string> positionals;
    if (!collect_positionals(args, result, command, usage, positionals)) {
        return;
    }
    if (positionals.size() < names.size()) {
        fail(result, missing_arguments(
                         std::vector<std::string>(names.begin() + static_cast<std::ptrdiff_t>(
                                                                      positionals.size()),
                                                  names.end()),
                         usage));
        return;
    }
    if (positionals.size() > names.size()) {
        fail(result, unexpected_argument(positionals[names.size()].c_str(), usage));
        return;
    }

    const std::string_view cmd = command;
    if (cmd == "show") {
        result.command = ShowCommand{positionals[0]};
    } else if (cmd == "new") {
        result.command = NewCommand{positionals[0]};
    } else if (cmd == "remove") {
        RemoveCommand c;
        c.name = positionals[0];
        if (!require_line(result, positionals[1], "LINE", c.line)) {
            return;
        }
        result.command = std::move(c);
    } else if (cmd == "move") {
        MoveCommand c;
        c.name = positionals[0];
        if (!require_line(result, positionals[1], "FROM", c.from) ||
            !require_line(result, positionals[2], "TO", c.to)) {
            return;
        }
        result.command = std::move(c);
    } else if (cmd == "set") {
        SetCommand c;
        c.name = positionals[0];
        if (!require_line(result, positionals[1], "LINE", c.line)) {
            return;
        }
        c.field = positionals[2];
        c.value = positionals[3];
        result.command = std::move(c);
    }
    result.ok = true;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("qrpolicy ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: qrpolicy [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  lint     Validate policy files and report diagnostics\n"
               "  check    Evaluate an RPC request against the policy\n"
               "  list     List policy files\n"
               "  show     Print a policy file with line numbers and diagnostics\n"
               "  add      Insert a rule into a policy file\n"
               "  remove   Delete a line from a policy file\n"
               "  move     Move a line within a policy file\n"
               "  set      Replace one field of a rule\n"
               "  new      Create an empty policy file\n"
               "  help     Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --policy-dir <DIR>  Policy directory [default: /etc/qubes/policy.d]\n"
               "  -q, --quiet             Suppress informational output\n"
               "  -v...                   Print verbose output\n"
               "      --no-color          Disable coloured output\n"
               "  -h, --help              Print help\n"
               "  -V, --version           Print version\n";
    }

    const std::string& c = *command;
    if (c == "lint") {
        return "Validate policy files and report diagnostics\n"
               "\n"
               "Usage: qrpolicy lint [OPTIONS] [NAME]...\n"
               "\n"
               "Arguments:\n"
               "  [NAME]...  Policy files to check (default: all files)\n"
               "\n"
               "Options:\n"
               "  -j, --json             Output diagnostics as JSON\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -h, --help             Print help\n";
    }
    if (c == "check") {
        return "Evaluate an RPC request against the policy\n"
               "\n"
               "Usage: qrpolicy check [OPTIONS] --service <SERVICE> --source <SOURCE>\n"
               "\n"
               "Options:\n"
               "      --service <SERVICE>    Requested RPC service\n"
               "      --argument <ARGUMENT>  Service argument (without '+')\n"
               "      --source <SOURCE>      Calling qube\n"
               "      --target <TARGET>      Requested target (default: none)\n"
               "      --qubes <FILE>         YAML file with qube types and tags\n"
               "  -j, --json                 Output the decision as JSON\n"
               "  -o, --output <OUTPUT>      Save output to a file\n"
               "  -h, --help                 Print help\n";
    }
    if (c == "list") {
        return "List policy files\n"
               "\n"
               "Usage: qrpolicy list\n";
    }
    if (c == "show") {
        return "Print a policy file with line numbers and diagnostics\n"
               "\n"
               "Usage: qrpolicy show <NAME>\n";
    }
    if (c == "add") {
        return "Insert a rule into a policy file\n"
               "\n"
               "Usage: qrpolicy add [OPTIONS] <NAME> <TOKEN>...\n"
               "\n"
               "Arguments:\n"
               "  <NAME>      Policy file\n"
               "  <TOKEN>...  SERVICE ARGUMENT SOURCE TARGET ACTION [PARAM=VALUE]...\n"
               "\n"
               "Options:\n"
               "      --at <LINE>  Insert before this line (default: append)\n"
               "  -h, --help       Print help\n";
    }
    if (c == "remove") {
        return "Delete a line from a policy file\n"
               "\n"
               "Usage: qrpolicy remove <NAME> <LINE>\n";
    }
    if (c == "move") {
        return "Move a line within a policy file\n"
               "\n"
               "Usage: qrpolicy move <NAME> <FROM> <TO>\n";
    }
    if (c == "set") {
        return "Replace one field of a rule\n"
               "\n"
               "Usage: qrpolicy set <NAME> <LINE> <FIELD> <VALUE>\n"
               "\n"
               "Arguments:\n"
               "  <FIELD>  service, argument, source, destination or action\n";
    }
    if (c == "new") {
        return "Create an empty policy file\n"
               "\n"
               "Usage: qrpolicy new <NAME>\n";
    }
    return "error: unrecognized subcommand '" + c + "'\n";
}

std::optional<std::size_t> parse_line_number(std::string_view s) {
    if (s.empty() || s.size() > 9) {
        return std::nullopt;
    }
    std::size_t n = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    if (n == 0) {
        return std::nullopt;
    }
    return n;
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    Args args(argc, argv, 1);
    const char* cmd = nullptr;
    while (!args.done()) {
        const char* arg = args.next();
        if (apply_global_flag(arg, result.global)) {
            continue;
        } else if (is_option(arg, "--policy-dir")) {
            const char* v = args.value_of(arg, "--policy-dir");
            if (v == nullptr) {
                return fail(result, missing_value("--policy-dir <DIR>"));
            }
            result.global.policy_dir = platform::path_from_utf8(v);
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd = arg;
            break;
        } else {
            return fail(result, render_usage_error(
                                    std::string("error: unexpected argument '") + arg + "' found",
                                    USAGE_MAIN));
        }
    }

    if (cmd == nullptr) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    if (str_eq(cmd, "lint")) {
        parse_lint(args, result);
    } else if (str_eq(cmd, "check")) {
        parse_check(args, result);
    } else if (str_eq(cmd, "list")) {
        std::vector<std::string> extra;
        if (collect_positionals(args, result, "list", "qrpolicy list", extra)) {
            if (!extra.empty()) {
                return fail(result, unexpected_argument(extra.front().c_str(), "qrpolicy list"));
            }
            result.ok = true;
            result.command = ListCommand{};
        }
    } else if (str_eq(cmd, "show")) {
        parse_fixed(args, result, "show", USAGE_SHOW, {"<NAME>"});
    } else if (str_eq(cmd, "add")) {
        parse_add(args, result);
    } else if (str_eq(cmd, "remove")) {
        parse_fixed(args, result, "remove", USAGE_REMOVE, {"<NAME>", "<LINE>"});
    } else if (str_eq(cmd, "move")) {
        parse_fixed(args, result, "move", USAGE_MOVE, {"<NAME>", "<FROM>", "<TO>"});
    } else if (str_eq(cmd, "set")) {
        parse_fixed(args, result, "set", USAGE_SET, {"<NAME>", "<LINE>", "<FIELD>", "<VALUE>"});
    } else if (str_eq(cmd, "new")) {
        parse_fixed(args, result, "new", USAGE_NEW, {"<NAME>"});
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (!args.done()) {
            result.command = HelpCommand{args.next()};
        } else {
            result.command = HelpCommand{};
        }
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        return fail(result, render_usage_error(
                                std::string("error: unrecognized subcommand '") + cmd + "'",
                                USAGE_MAIN));
    }

    return result;
}

}  // namespace qrpolicy::cli
