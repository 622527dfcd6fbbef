// ==============================================================================
// qrpolicy/qube_info.hpp - Метаданные qube из YAML
// ==============================================================================
//
// Назначение:
// - StaticQubeInfo: таблица qube -> {type, tags, template}
// - Загрузка таблицы из YAML (yaml-cpp)
//
// Формат файла:
//   qubes:
//     work:
//       type: AppVM
//       tags: [work, created-by-dom0]
//     disp1234:
//       type: DispVM
//       template: fedora-dvm
//
// ==============================================================================

#ifndef QRPOLICY_QUBE_INFO_HPP
#define QRPOLICY_QUBE_INFO_HPP

#include "qrpolicy/evaluator.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace qrpolicy {

/// Описание одного qube
struct QubeRecord {
    std::optional<std::string> type;
    std::set<std::string, std::less<>> tags;
    std::optional<std::string> dispvm_template;
};

class StaticQubeInfo : public QubeInfo {
public:
    StaticQubeInfo() = default;

    /// Добавить или заменить запись
    void add(std::string name, QubeRecord record);

    std::size_t size() const { return qubes_.size(); }

    std::optional<std::string> type_of(std::string_view qube) const override;
    bool has_tag(std::string_view qube, std::string_view tag) const override;
    std::optional<std::string> dispvm_template_of(std::string_view qube) const override;

private:
    const QubeRecord* find(std::string_view qube) const;

    std::map<std::string, QubeRecord, std::less<>> qubes_;
};

/// Результат загрузки метаданных
struct QubeInfoResult {
    bool ok = false;
    StaticQubeInfo info;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML-текст с метаданными
QubeInfoResult parse_qube_info(std::string_view yaml_text);

/// Загрузить метаданные из файла
QubeInfoResult load_qube_info(const std::filesystem::path& path);

}  // namespace qrpolicy

#endif  // QRPOLICY_QUBE_INFO_HPP
