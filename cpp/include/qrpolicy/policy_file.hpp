// ==============================================================================
// qrpolicy/policy_file.hpp - Модель файла политики
// ==============================================================================
//
// Назначение:
// - Упорядоченная последовательность Line одного файла
// - validate(): чистая, идемпотентная проверка всех строк
// - can_save(): запрет сохранения при наличии Malformed строк
// - serialize(): побайтово стабильная сериализация
//
// Порядок строк значим (first-match), сохраняется вместе с пустыми
// строками и комментариями.
//
// ==============================================================================

#ifndef QRPOLICY_POLICY_FILE_HPP
#define QRPOLICY_POLICY_FILE_HPP

#include "qrpolicy/diagnostic.hpp"
#include "qrpolicy/rule.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy {

class PolicyFile {
public:
    /// Пустой файл
    explicit PolicyFile(std::string name, bool includes_allowed = true);

    /// Разобрать текст файла
    static PolicyFile from_text(std::string name, std::string_view text,
                                bool includes_allowed = true);

    const std::string& name() const { return name_; }
    bool includes_allowed() const { return includes_allowed_; }
    bool trailing_newline() const { return trailing_newline_; }

    const std::vector<Line>& lines() const { return lines_; }
    std::size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }
    const Line& line(std::size_t index) const { return lines_.at(index); }

    /// Тексты всех строк в порядке следования
    std::vector<std::string> line_texts() const;

    /// Правила файла (в порядке строк)
    std::vector<const Rule*> rules() const;

    /// Полный набор диагностик, пересчитанный из текста строк
    ///
    /// Функция не имеет скрытого состояния: повторный вызов на неизменённом
    /// файле возвращает идентичный результат. Помимо диагностик отдельных
    /// строк добавляет предупреждения RedundantRule для повторяющихся правил.
    std::vector<Diagnostic> validate() const;

    /// true, если в файле нет Malformed строк
    bool can_save() const;

    /// Текст файла
    std::string serialize() const;

    /// Заменить все строки; новый вектор строится целиком до подмены
    /// @throws std::invalid_argument если текст строки содержит '\n'
    void assign(std::vector<std::string> texts, bool trailing_newline);

private:
    std::string name_;
    bool includes_allowed_ = true;
    bool trailing_newline_ = true;
    std::vector<Line> lines_;
};

/// Разобрать набор строк с нумерацией с 1
std::vector<Line> parse_lines(const std::vector<std::string>& texts, const ParseOptions& options);

/// Предупреждения о правилах, повторяющих более раннее правило файла
std::vector<Diagnostic> find_redundant_rules(const std::vector<Line>& lines);

}  // namespace qrpolicy

#endif  // QRPOLICY_POLICY_FILE_HPP
