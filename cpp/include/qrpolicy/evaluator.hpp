// ==============================================================================
// qrpolicy/evaluator.hpp - Вычисление политики для синтетического запроса
// ==============================================================================
//
// Назначение:
// - Request: (service, argument, source, destination?)
// - QubeInfo: внешний источник метаданных qube (тип, теги, шаблон DispVM)
// - evaluate(): первое совпавшее правило по порядку файлов и строк
//
// Файлы просматриваются в порядке, заданном вызывающей стороной (обычно
// лексикографически по имени, см. sort_by_name). Строки !include и
// !include-dir разворачивают включаемые файлы на месте, !include-service
// подключает файл старого формата только для указанных сервиса и аргумента. Отсутствие совпадения
// (std::nullopt) трактуется вызывающей стороной как неявный deny.
//
// evaluate() - чистая функция над константными данными.
//
// ==============================================================================

#ifndef QRPOLICY_EVALUATOR_HPP
#define QRPOLICY_EVALUATOR_HPP

#include "qrpolicy/policy_file.hpp"
#include "qrpolicy/rule.hpp"
#include "qrpolicy/specifier.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy {

// ============================================================================
// Request
// ============================================================================

/// Синтетический запрос qrexec
struct Request {
    std::string service;
    std::string argument;                    // без ведущего '+', пусто = без аргумента
    std::string source;                      // конкретный qube
    std::optional<std::string> destination;  // nullopt = цель не указана (@default)
};

// ============================================================================
// QubeInfo - метаданные qube (внешний коллаборатор)
// ============================================================================

class QubeInfo {
public:
    virtual ~QubeInfo() = default;

    /// Тип qube (AppVM, TemplateVM, DispVM, ...)
    virtual std::optional<std::string> type_of(std::string_view qube) const = 0;

    /// Есть ли у qube тег
    virtual bool has_tag(std::string_view qube, std::string_view tag) const = 0;

    /// Шаблон, на котором основан disposable qube
    virtual std::optional<std::string> dispvm_template_of(std::string_view qube) const = 0;
};

/// Метаданных нет: @tag: и @type: не совпадают ни с чем
class NoQubeInfo : public QubeInfo {
public:
    std::optional<std::string> type_of(std::string_view) const override { return std::nullopt; }
    bool has_tag(std::string_view, std::string_view) const override { return false; }
    std::optional<std::string> dispvm_template_of(std::string_view) const override {
        return std::nullopt;
    }
};

// ============================================================================
// EvaluationContext
// ============================================================================

/// Таблица включаемых файлов: имя ("include/admin-local-rwx") -> файл
using IncludeTable = std::map<std::string, const PolicyFile*, std::less<>>;

struct EvaluationContext {
    const QubeInfo* qubes = nullptr;  // nullptr = без метаданных
    IncludeTable includes;
};

/// Найти включаемый файл по пути из директивы !include
const PolicyFile* resolve_include(const IncludeTable& includes, std::string_view path);

/// Файлы каталога из директивы !include-dir, по имени
///
/// Каталог определяется последним компонентом пути: "include/" и
/// "/etc/qubes/policy.d/include" дают файлы "include/<name>".
std::vector<const PolicyFile*> resolve_include_dir(const IncludeTable& includes,
                                                   std::string_view path);

// ============================================================================
// Evaluate
// ============================================================================

/// Решающее правило и его местоположение
struct Match {
    Action action;
    std::string file;
    std::size_t line_number = 0;
};

/// Совпадает ли правило с запросом
bool rule_matches(const Rule& rule, const Request& request, const QubeInfo& qubes);

/// Совпадает ли спецификатор с qube запроса в позиции source/destination
bool qube_matches(const QubeSpecifier& spec, const std::optional<std::string>& qube,
                  Position position, const QubeInfo& qubes);

/// Первое совпавшее правило с местоположением
std::optional<Match> evaluate_match(const std::vector<PolicyFile>& files, const Request& request,
                                    const EvaluationContext& context = {});

/// Действие первого совпавшего правила
std::optional<Action> evaluate(const std::vector<PolicyFile>& files, const Request& request,
                               const EvaluationContext& context = {});

/// Упорядочить файлы по имени (порядок загрузки политик с диска)
void sort_by_name(std::vector<PolicyFile>& files);

}  // namespace qrpolicy

#endif  // QRPOLICY_EVALUATOR_HPP
