// ==============================================================================
// qrpolicy/session.hpp - Сессия редактирования политик
// ==============================================================================
//
// Назначение:
// - Владение открытыми моделями файлов в пределах одной сессии
// - Структурные правки (вставка, перемещение, удаление, правка поля)
// - Сохранение только при отсутствии ошибок, атомарно через PolicyStore
//
// Модель доступа: один писатель на сессию. Каждая правка строит новый
// набор строк целиком и подменяет старый, промежуточное состояние не
// наблюдаемо. Правки возвращают актуальные диагностики файла.
//
// Индексы строк 0-based. Ошибка вызывающей стороны (неизвестный файл,
// индекс вне диапазона) - std::out_of_range.
//
// ==============================================================================

#ifndef QRPOLICY_SESSION_HPP
#define QRPOLICY_SESSION_HPP

#include "qrpolicy/diagnostic.hpp"
#include "qrpolicy/policy_file.hpp"
#include "qrpolicy/rule.hpp"
#include "qrpolicy/store.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy {

/// Результат open/create/reset
struct OpenResult {
    bool ok = false;
    std::vector<Diagnostic> diagnostics;
    StoreError error;

    explicit operator bool() const { return ok; }
};

enum class SaveErrorKind { Validation, Io };

struct SaveResult {
    bool ok = false;
    SaveErrorKind kind = SaveErrorKind::Io;
    std::string message;
    std::vector<Diagnostic> diagnostics;  // все диагностики при Validation
    StoreError store_error;               // при Io

    explicit operator bool() const { return ok; }
};

class EditorSession {
public:
    explicit EditorSession(PolicyStore& store);

    // Файлы сессии
    // -------------------------------------------------------------------------

    /// Открыть существующий файл из хранилища
    OpenResult open(std::string_view name);

    /// Создать новый пустой файл (в хранилище появится при save)
    OpenResult create(std::string_view name);

    /// Перечитать файл из хранилища, отбросив правки (новый файл - очистить)
    OpenResult reset(std::string_view name);

    /// Закрыть файл без сохранения
    void close(std::string_view name);

    bool is_open(std::string_view name) const;

    std::vector<std::string> open_files() const;

    const PolicyFile& file(std::string_view name) const;

    /// Есть ли несохранённые правки
    bool modified(std::string_view name) const;

    // Правки
    // -------------------------------------------------------------------------

    /// Вставить правило перед строкой index (index == size - в конец)
    ///
    /// Каждый токен - одно поле: пустой токен, пробел или управляющий символ
    /// внутри токена, а также пустой список отклоняются. Файл тогда не
    /// меняется, возвращаются диагностики токенов.
    std::vector<Diagnostic> insert_rule(std::string_view name, std::size_t index,
                                        const std::vector<std::string>& tokens);

    /// Переместить строку from на позицию to
    std::vector<Diagnostic> move_rule(std::string_view name, std::size_t from, std::size_t to);

    /// Удалить строку
    std::vector<Diagnostic> delete_line(std::string_view name, std::size_t index);

    /// Заменить одно поле правила; строка пересобирается в каноническом виде
    ///
    /// Значение проверяется как в insert_rule (для action - каждый токен
    /// ключевого слова и параметров); при отказе файл не меняется.
    /// @throws std::invalid_argument если строка не является правилом
    std::vector<Diagnostic> edit_field(std::string_view name, std::size_t index, Field field,
                                       std::string_view value);

    /// Заменить весь текст файла (свободное редактирование)
    std::vector<Diagnostic> set_text(std::string_view name, std::string_view text);

    /// Текущие диагностики файла
    std::vector<Diagnostic> diagnostics(std::string_view name) const;

    // Сохранение
    // -------------------------------------------------------------------------

    /// Сохранить файл; отказ без записи, если can_save() == false
    SaveResult save(std::string_view name);

private:
    struct OpenFile {
        PolicyFile model;
        std::string token;
        bool modified = false;
    };

    OpenFile& entry(std::string_view name);
    const OpenFile& entry(std::string_view name) const;

    /// Подменить строки файла и вернуть диагностики
    std::vector<Diagnostic> commit(OpenFile& f, std::vector<std::string> texts);

    PolicyStore& store_;
    std::map<std::string, OpenFile, std::less<>> files_;
};

}  // namespace qrpolicy

#endif  // QRPOLICY_SESSION_HPP
