// ==============================================================================
// qrpolicy/store.hpp - Хранилище файлов политики
// ==============================================================================
//
// Назначение:
// - PolicyStore: интерфейс внешнего хранилища (list/get/replace)
// - DirectoryStore: каталог политик на диске
// - Токен изменения: дайджест содержимого на момент чтения; замена с
//   устаревшим токеном отклоняется
//
// Раскладка каталога:
//   <root>/<name>.policy       - основные файлы ("50-config-clipboard")
//   <root>/include/<name>      - включаемые фрагменты ("include/admin-ro")
//
// ==============================================================================

#ifndef QRPOLICY_STORE_HPP
#define QRPOLICY_STORE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy {

/// Префикс имён включаемых фрагментов
constexpr const char* INCLUDE_PREFIX = "include/";

/// Расширение основных файлов политики
constexpr const char* POLICY_EXTENSION = ".policy";

/// Токен нового (ещё не существующего) файла
constexpr const char* NEW_TOKEN = "new";

/// Токен, отключающий проверку конкурентного изменения
constexpr const char* ANY_TOKEN = "any";

// ============================================================================
// Ошибки хранилища
// ============================================================================

enum class StoreErrorKind { NotFound, AccessDenied, InvalidName, Exists, Conflict, Io };

std::string to_string(StoreErrorKind kind);

struct StoreError {
    StoreErrorKind kind = StoreErrorKind::Io;
    std::string name;
    std::string message;

    std::string format() const;
};

struct FetchResult {
    bool ok = false;
    std::string content;
    std::string token;
    StoreError error;

    explicit operator bool() const { return ok; }
};

struct StoreResult {
    bool ok = false;
    StoreError error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Имена
// ============================================================================

/// Имя вида "include/<name>"
bool is_include_name(std::string_view name);

/// Имя файла без префикса: [A-Za-z0-9_-]+
bool is_valid_file_name(std::string_view name);

/// Имя файла (с необязательным префиксом include/) допустимо
bool is_valid_policy_name(std::string_view name);

/// Токен содержимого (64-битный FNV-1a, 16 hex-символов)
std::string content_token(std::string_view content);

// ============================================================================
// PolicyStore
// ============================================================================

class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    /// Основные файлы (по имени), затем include/ фрагменты (по имени)
    virtual std::vector<std::string> list() const = 0;

    virtual bool exists(std::string_view name) const = 0;

    /// Прочитать файл и его токен
    virtual FetchResult get(std::string_view name) const = 0;

    /// Заменить файл атомарно
    ///
    /// token: NEW_TOKEN - файл не должен существовать; ANY_TOKEN - без
    /// проверки; иначе - токен из get(), файл не должен измениться с тех пор.
    virtual StoreResult replace(std::string_view name, std::string_view content,
                                std::string_view token) = 0;
};

// ============================================================================
// DirectoryStore
// ============================================================================

class DirectoryStore : public PolicyStore {
public:
    explicit DirectoryStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    /// Путь файла на диске
    std::filesystem::path path_of(std::string_view name) const;

    std::vector<std::string> list() const override;
    bool exists(std::string_view name) const override;
    FetchResult get(std::string_view name) const override;
    StoreResult replace(std::string_view name, std::string_view content,
                        std::string_view token) override;

private:
    std::filesystem::path root_;
};

}  // namespace qrpolicy

#endif  // QRPOLICY_STORE_HPP
