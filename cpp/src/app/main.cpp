// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе приложения и печатаются как "[x]".
//
// ==============================================================================

#include "qrpolicy/cli.hpp"
#include "qrpolicy/diagnostic.hpp"
#include "qrpolicy/evaluator.hpp"
#include "qrpolicy/output.hpp"
#include "qrpolicy/platform.hpp"
#include "qrpolicy/policy_set.hpp"
#include "qrpolicy/qube_info.hpp"
#include "qrpolicy/session.hpp"
#include "qrpolicy/store.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

using namespace qrpolicy;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Writer для stdout команды: отдельный, если задан --output
output::Writer* select_output(output::Writer& writer,
                              const std::optional<std::filesystem::path>& path,
                              std::unique_ptr<output::Writer>& holder) {
    if (!path.has_value()) {
        return &writer;
    }
    output::OutputConfig cfg = writer.config();
    cfg.output_path = path;
    holder = std::make_unique<output::Writer>(cfg);
    if (!holder->has_output_file()) {
        throw std::runtime_error("cannot open output file " + platform::path_to_utf8(*path));
    }
    return holder.get();
}

/// Напечатать диагностики файла: ошибки через error, предупреждения через warn
void report_diagnostics(output::Writer& writer, const std::string& name,
                        const std::vector<Diagnostic>& diagnostics) {
    for (const auto& d : diagnostics) {
        const std::string text = name + ": " + d.format();
        if (d.is_error()) {
            writer.error(text);
        } else {
            writer.warn(text);
        }
    }
}

std::size_t count_errors(const std::vector<Diagnostic>& diagnostics) {
    std::size_t n = 0;
    for (const auto& d : diagnostics) {
        if (d.is_error()) {
            ++n;
        }
    }
    return n;
}

rapidjson::Value string_value(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value diagnostic_to_json(const Diagnostic& d,
                                    rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("line", static_cast<uint64_t>(d.line_number), alloc);
    obj.AddMember("column", static_cast<uint64_t>(d.column), alloc);
    obj.AddMember("length", static_cast<uint64_t>(d.length), alloc);
    obj.AddMember("severity", string_value(to_string(d.severity()), alloc), alloc);
    obj.AddMember("kind", string_value(to_string(d.kind()), alloc), alloc);
    obj.AddMember("code", string_value(to_string(d.code), alloc), alloc);
    obj.AddMember("message", string_value(d.message, alloc), alloc);
    return obj;
}

/// Итог сохранения сессии
int finish_edit(EditorSession& session, const std::string& name, output::Writer& writer) {
    auto saved = session.save(name);
    if (!saved) {
        switch (saved.kind) {
        case SaveErrorKind::Validation:
            report_diagnostics(writer, name, saved.diagnostics);
            writer.error(saved.message);
            return 1;
        case SaveErrorKind::Io:
            writer.error(saved.message);
            return 1;
        }
        return 1;
    }
    report_diagnostics(writer, name, saved.diagnostics);
    writer.info("Saved " + name);
    return 0;
}

/// Правка отклонена или оставила ошибки: сообщить и не сохранять
bool edit_rejected(const std::vector<Diagnostic>& diagnostics, const std::string& name,
                   output::Writer& writer) {
    if (count_errors(diagnostics) == 0) {
        return false;
    }
    report_diagnostics(writer, name, diagnostics);
    writer.error("policy file " + name + " contains errors, not saved");
    return true;
}

/// Открыть файл в сессии; false и сообщение при ошибке
bool open_for_edit(EditorSession& session, const std::string& name, output::Writer& writer) {
    auto opened = session.open(name);
    if (!opened) {
        writer.error(opened.error.format());
        return false;
    }
    writer.debug("Opened " + name + " (" + std::to_string(session.file(name).size()) + " lines)");
    return true;
}

/// Номер строки из командной строки (1-based) в пределах [1, limit]
bool check_line(std::size_t line, std::size_t limit, const std::string& name,
                output::Writer& writer) {
    if (line >= 1 && line <= limit) {
        return true;
    }
    writer.error("line " + std::to_string(line) + " is out of range for " + name + " (" +
                 std::to_string(limit) + " lines)");
    return false;
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_lint(const cli::LintCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = select_output(writer, cmd.output, file_writer);

    std::vector<std::string> names = cmd.names.empty() ? store.list() : cmd.names;
    writer.info("Linting " + std::to_string(names.size()) + " policy files in " +
                platform::path_to_utf8(store.root()));

    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();
    rapidjson::Value files(rapidjson::kArrayType);

    std::size_t errors = 0;
    std::size_t warnings = 0;
    bool failed = false;

    for (const auto& name : names) {
        PolicyFile file(name);
        auto fetched = load_policy_file(store, name, file);
        if (!fetched) {
            writer.error(fetched.error.format());
            failed = true;
            continue;
        }

        const auto diagnostics = file.validate();
        const std::size_t file_errors = count_errors(diagnostics);
        errors += file_errors;
        warnings += diagnostics.size() - file_errors;
        writer.trace(name + ": " + std::to_string(file.rules().size()) + " rules");

        if (cmd.json) {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("name", string_value(name, alloc), alloc);
            entry.AddMember("can_save", file.can_save(), alloc);
            rapidjson::Value list(rapidjson::kArrayType);
            for (const auto& d : diagnostics) {
                list.PushBack(diagnostic_to_json(d, alloc), alloc);
            }
            entry.AddMember("diagnostics", list, alloc);
            files.PushBack(entry, alloc);
        } else {
            for (const auto& d : diagnostics) {
                out->write_line(output::Stream::Stdout, name + ": " + d.format());
            }
        }
    }

    if (cmd.json) {
        doc.AddMember("files", files, alloc);
        doc.AddMember("errors", static_cast<uint64_t>(errors), alloc);
        doc.AddMember("warnings", static_cast<uint64_t>(warnings), alloc);
        out->write_json_pretty(doc);
    }

    if (errors > 0) {
        writer.error("Found " + std::to_string(errors) + " errors and " +
                     std::to_string(warnings) + " warnings");
        return 1;
    }
    writer.info("No errors found (" + std::to_string(warnings) + " warnings)");
    return failed ? 1 : 0;
}

int run_check(const cli::CheckCommand& cmd, const cli::GlobalOptions& global,
              output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = select_output(writer, cmd.output, file_writer);

    std::unique_ptr<StaticQubeInfo> qubes;
    if (cmd.qubes.has_value()) {
        auto loaded = load_qube_info(*cmd.qubes);
        if (!loaded) {
            writer.error(loaded.error);
            return 1;
        }
        qubes = std::make_unique<StaticQubeInfo>(std::move(loaded.info));
        writer.debug("Loaded metadata for " + std::to_string(qubes->size()) + " qubes");
    }

    auto set = load_policy_set(store);
    for (const auto& e : set.errors) {
        writer.warn(e.format());
    }
    for (const auto& f : set.files) {
        if (!f.can_save()) {
            writer.warn(f.name() + " contains malformed lines, they are ignored");
        }
    }

    Request request;
    request.service = cmd.service;
    request.argument = cmd.argument;
    request.source = cmd.source;
    request.destination = cmd.target;

    auto match = evaluate_match(set.files, request, set.context(qubes.get()));

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kObjectType);
        auto& alloc = doc.GetAllocator();
        rapidjson::Value req(rapidjson::kObjectType);
        req.AddMember("service", string_value(request.service, alloc), alloc);
        req.AddMember("argument", string_value(request.argument, alloc), alloc);
        req.AddMember("source", string_value(request.source, alloc), alloc);
        req.AddMember("target",
                      string_value(request.destination.value_or(KW_DEFAULT), alloc), alloc);
        doc.AddMember("request", req, alloc);
        if (match) {
            doc.AddMember("decision", string_value(to_string(match->action.kind), alloc), alloc);
            doc.AddMember("action", string_value(to_string(match->action), alloc), alloc);
            doc.AddMember("file", string_value(match->file, alloc), alloc);
            doc.AddMember("line", static_cast<uint64_t>(match->line_number), alloc);
            if (auto user = match->action.param(PARAM_USER)) {
                doc.AddMember("user", string_value(*user, alloc), alloc);
            }
            doc.AddMember("implicit", false, alloc);
        } else {
            doc.AddMember("decision", string_value(to_string(ActionKind::Deny), alloc), alloc);
            doc.AddMember("implicit", true, alloc);
        }
        out->write_json_pretty(doc);
        return 0;
    }

    if (match) {
        out->write_line(output::Stream::Stdout, to_string(match->action));
        writer.info("Matched " + match->file + " line " + std::to_string(match->line_number));
        if (auto user = match->action.param(PARAM_USER)) {
            writer.info("Service runs as user " + *user);
        }
    } else {
        out->write_line(output::Stream::Stdout, to_string(ActionKind::Deny));
        writer.info("No rule matched, the call is denied");
    }
    return 0;
}

int run_list(const cli::GlobalOptions& global, output::Writer& writer) {
    DirectoryStore store(global.policy_dir);

    output::Table table;
    table.set_headers({"Name", "Kind", "Rules", "Errors", "Warnings"});
    for (const auto& name : store.list()) {
        PolicyFile file(name);
        auto fetched = load_policy_file(store, name, file);
        if (!fetched) {
            writer.warn(fetched.error.format());
            continue;
        }
        const auto diagnostics = file.validate();
        const std::size_t errors = count_errors(diagnostics);
        table.add_row({name, is_include_name(name) ? "include" : "policy",
                       std::to_string(file.rules().size()), std::to_string(errors),
                       std::to_string(diagnostics.size() - errors)});
    }

    if (table.row_count() == 0) {
        writer.info("No policy files in " + platform::path_to_utf8(store.root()));
        return 0;
    }
    table.print(writer);
    return 0;
}

int run_show(const cli::ShowCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    if (!open_for_edit(session, cmd.name, writer)) {
        return 1;
    }

    const PolicyFile& file = session.file(cmd.name);
    for (std::size_t i = 0; i < file.size(); ++i) {
        std::string number = std::to_string(i + 1);
        if (number.size() < 4) {
            number.insert(0, 4 - number.size(), ' ');
        }
        writer.write_line(output::Stream::Stdout, number + "  " + line_text(file.line(i)));
    }
    report_diagnostics(writer, cmd.name, session.diagnostics(cmd.name));
    return 0;
}

int run_add(const cli::AddCommand& cmd, const cli::GlobalOptions& global,
            output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    if (!open_for_edit(session, cmd.name, writer)) {
        return 1;
    }
    const std::size_t size = session.file(cmd.name).size();
    // --at N: вставка перед строкой N, N = size + 1 - в конец
    if (cmd.at && !check_line(*cmd.at, size + 1, cmd.name, writer)) {
        return 1;
    }
    const std::size_t index = cmd.at ? *cmd.at - 1 : size;
    if (edit_rejected(session.insert_rule(cmd.name, index, cmd.tokens), cmd.name, writer)) {
        return 1;
    }
    return finish_edit(session, cmd.name, writer);
}

int run_remove(const cli::RemoveCommand& cmd, const cli::GlobalOptions& global,
               output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    if (!open_for_edit(session, cmd.name, writer)) {
        return 1;
    }
    if (!check_line(cmd.line, session.file(cmd.name).size(), cmd.name, writer)) {
        return 1;
    }
    session.delete_line(cmd.name, cmd.line - 1);
    return finish_edit(session, cmd.name, writer);
}

int run_move(const cli::MoveCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    if (!open_for_edit(session, cmd.name, writer)) {
        return 1;
    }
    const std::size_t size = session.file(cmd.name).size();
    if (!check_line(cmd.from, size, cmd.name, writer) || !check_line(cmd.to, size, cmd.name, writer)) {
        return 1;
    }
    session.move_rule(cmd.name, cmd.from - 1, cmd.to - 1);
    return finish_edit(session, cmd.name, writer);
}

int run_set(const cli::SetCommand& cmd, const cli::GlobalOptions& global,
            output::Writer& writer) {
    const Field field = parse_field(cmd.field);
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    if (!open_for_edit(session, cmd.name, writer)) {
        return 1;
    }
    const PolicyFile& file = session.file(cmd.name);
    if (!check_line(cmd.line, file.size(), cmd.name, writer)) {
        return 1;
    }
    if (line_rule(file.line(cmd.line - 1)) == nullptr) {
        writer.error("line " + std::to_string(cmd.line) + " of " + cmd.name + " is not a rule");
        return 1;
    }
    if (edit_rejected(session.edit_field(cmd.name, cmd.line - 1, field, cmd.value), cmd.name,
                      writer)) {
        return 1;
    }
    return finish_edit(session, cmd.name, writer);
}

int run_new(const cli::NewCommand& cmd, const cli::GlobalOptions& global,
            output::Writer& writer) {
    DirectoryStore store(global.policy_dir);
    EditorSession session(store);
    auto created = session.create(cmd.name);
    if (!created) {
        writer.error(created.error.format());
        return 1;
    }
    return finish_edit(session, cmd.name, writer);
}

// ----------------------------------------------------------------------------
// Главная функция выполнения
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_color = parse_result.global.no_color;
    output::Writer writer(out_cfg);

    // Сообщение об ошибке разбора печатается без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    const auto& global = parse_result.global;
    writer.trace("Policy directory: " + platform::path_to_utf8(global.policy_dir));

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                return run_lint(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::CheckCommand>) {
                return run_check(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::ListCommand>) {
                return run_list(global, writer);
            } else if constexpr (std::is_same_v<T, cli::ShowCommand>) {
                return run_show(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::AddCommand>) {
                return run_add(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::RemoveCommand>) {
                return run_remove(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::MoveCommand>) {
                return run_move(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::SetCommand>) {
                return run_set(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::NewCommand>) {
                return run_new(cmd, global, writer);
            } else {
                static_assert(std::is_same_v<T, void>, "unhandled command");
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
