// ==============================================================================
// store.cpp - Каталог файлов политики
// ==============================================================================

#include "qrpolicy/store.hpp"

#include "qrpolicy/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <system_error>

namespace qrpolicy {

namespace {

constexpr std::string_view INCLUDE_DIR = "include";

std::string_view strip_include(std::string_view name) {
    return is_include_name(name) ? name.substr(std::string_view(INCLUDE_PREFIX).size()) : name;
}

StoreError make_error(StoreErrorKind kind, std::string_view name, std::string message) {
    return StoreError{kind, std::string(name), std::move(message)};
}

StoreErrorKind kind_from_errno(int code) {
    if (code == ENOENT) {
        return StoreErrorKind::NotFound;
    }
    if (code == EACCES || code == EPERM) {
        return StoreErrorKind::AccessDenied;
    }
    return StoreErrorKind::Io;
}

/// Отсортированные имена файлов каталога, отфильтрованные предикатом
template <typename Pred>
std::vector<std::string> list_dir(const std::filesystem::path& dir, Pred accept) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return names;
    }
    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (auto name = accept(it->path())) {
            names.push_back(std::move(*name));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace

// ============================================================================
// Ошибки
// ============================================================================

std::string to_string(StoreErrorKind kind) {
    switch (kind) {
    case StoreErrorKind::NotFound:
        return "not found";
    case StoreErrorKind::AccessDenied:
        return "access denied";
    case StoreErrorKind::InvalidName:
        return "invalid name";
    case StoreErrorKind::Exists:
        return "already exists";
    case StoreErrorKind::Conflict:
        return "conflict";
    case StoreErrorKind::Io:
        return "I/O error";
    }
    return "unknown";
}

std::string StoreError::format() const {
    std::string out = "policy store error";
    if (!name.empty()) {
        out += " [" + name + "]";
    }
    out += ": " + message;
    return out;
}

// ============================================================================
// Имена
// ============================================================================

bool is_include_name(std::string_view name) {
    const std::string_view prefix = INCLUDE_PREFIX;
    return name.size() > prefix.size() && name.substr(0, prefix.size()) == prefix;
}

bool is_valid_file_name(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    });
}

bool is_valid_policy_name(std::string_view name) {
    return is_valid_file_name(strip_include(name));
}

std::string content_token(std::string_view content) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

// ============================================================================
// DirectoryStore
// ============================================================================

DirectoryStore::DirectoryStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path DirectoryStore::path_of(std::string_view name) const {
    if (is_include_name(name)) {
        return root_ / std::string(INCLUDE_DIR) / platform::path_from_utf8(strip_include(name));
    }
    auto path = root_ / platform::path_from_utf8(name);
    path += POLICY_EXTENSION;
    return path;
}

std::vector<std::string> DirectoryStore::list() const {
    auto names = list_dir(root_, [](const std::filesystem::path& p) -> std::optional<std::string> {
        if (p.extension().string() != POLICY_EXTENSION) {
            return std::nullopt;
        }
        std::string stem = platform::path_to_utf8(p.stem());
        if (!is_valid_file_name(stem)) {
            return std::nullopt;
        }
        return stem;
    });

    auto includes = list_dir(root_ / std::string(INCLUDE_DIR),
                             [](const std::filesystem::path& p) -> std::optional<std::string> {
                                 std::string name = platform::path_to_utf8(p.filename());
                                 if (!is_valid_file_name(name)) {
                                     return std::nullopt;
                                 }
                                 return INCLUDE_PREFIX + name;
                             });

    names.insert(names.end(), includes.begin(), includes.end());
    return names;
}

bool DirectoryStore::exists(std::string_view name) const {
    if (!is_valid_policy_name(name)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(path_of(name), ec);
}

FetchResult DirectoryStore::get(std::string_view name) const {
    FetchResult result;
    if (!is_valid_policy_name(name)) {
        result.error = make_error(StoreErrorKind::InvalidName, name,
                                  "policy file names may only contain alphanumeric characters, "
                                  "underscore and hyphen");
        return result;
    }

    try {
        result.content = platform::read_file(path_of(name));
    } catch (const std::system_error& e) {
        result.error = make_error(kind_from_errno(e.code().value()), name, e.what());
        return result;
    }
    result.token = content_token(result.content);
    result.ok = true;
    return result;
}

StoreResult DirectoryStore::replace(std::string_view name, std::string_view content,
                                    std::string_view token) {
    StoreResult result;
    if (!is_valid_policy_name(name)) {
        result.error = make_error(StoreErrorKind::InvalidName, name,
                                  "policy file names may only contain alphanumeric characters, "
                                  "underscore and hyphen");
        return result;
    }

    const auto path = path_of(name);
    std::error_code ec;
    const bool present = std::filesystem::exists(path, ec);
    if (ec) {
        result.error = make_error(kind_from_errno(ec.value()), name, ec.message());
        return result;
    }

    if (token == NEW_TOKEN) {
        if (present) {
            result.error = make_error(StoreErrorKind::Exists, name, "policy file already exists");
            return result;
        }
    } else if (token != ANY_TOKEN) {
        if (!present) {
            result.error =
                make_error(StoreErrorKind::Conflict, name, "policy file was removed meanwhile");
            return result;
        }
        auto current = get(name);
        if (!current) {
            result.error = current.error;
            return result;
        }
        if (current.token != token) {
            result.error = make_error(StoreErrorKind::Conflict, name,
                                      "policy file was modified by someone else");
            return result;
        }
    }

    try {
        std::filesystem::create_directories(path.parent_path());
        platform::write_file_atomic(path, content);
    } catch (const std::system_error& e) {
        result.error = make_error(kind_from_errno(e.code().value()), name, e.what());
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace qrpolicy
