// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "qrpolicy/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace qrpolicy::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Чтение файла
// ----------------------------------------------------------------------------

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::system_error(errno != 0 ? errno : ENOENT, std::generic_category(),
                                "cannot open " + path_to_utf8(path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::system_error(EIO, std::generic_category(), "cannot read " + path_to_utf8(path));
    }
    return ss.str();
}

// ----------------------------------------------------------------------------
// Атомарная запись
// ----------------------------------------------------------------------------

#ifndef _WIN32

namespace {

/// Временный файл рядом с целью; удаляется, если не был переименован
class TempFile {
public:
    explicit TempFile(const std::filesystem::path& target) {
        std::filesystem::path dir = target.parent_path();
        if (dir.empty()) {
            dir = ".";
        }
        std::string tmpl = (dir / ("." + target.filename().string() + ".XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        fd_ = mkstemp(buf.data());
        if (fd_ == -1) {
            throw std::system_error(errno, std::generic_category(),
                                    "cannot create temporary file in " + path_to_utf8(dir));
        }
        path_ = buf.data();
    }

    ~TempFile() {
        if (fd_ != -1) {
            ::close(fd_);
        }
        if (!committed_) {
            ::unlink(path_.c_str());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    void write_all(std::string_view content) {
        const char* p = content.data();
        size_t left = content.size();
        while (left > 0) {
            ssize_t n = ::write(fd_, p, left);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(),
                                        "cannot write " + path_);
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    void copy_mode_from(const std::filesystem::path& target) {
        struct stat st {};
        mode_t mode = 0644;
        if (::stat(target.c_str(), &st) == 0) {
            mode = st.st_mode & 07777;
        }
        if (::fchmod(fd_, mode) != 0) {
            throw std::system_error(errno, std::generic_category(), "cannot chmod " + path_);
        }
    }

    void sync_and_close() {
        if (::fsync(fd_) != 0) {
            throw std::system_error(errno, std::generic_category(), "cannot fsync " + path_);
        }
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            throw std::system_error(errno, std::generic_category(), "cannot close " + path_);
        }
    }

    void rename_to(const std::filesystem::path& target) {
        if (::rename(path_.c_str(), target.c_str()) != 0) {
            throw std::system_error(errno, std::generic_category(),
                                    "cannot replace " + path_to_utf8(target));
        }
        committed_ = true;
    }

private:
    int fd_ = -1;
    std::string path_;
    bool committed_ = false;
};

}  // namespace

void write_file_atomic(const std::filesystem::path& path, std::string_view content) {
    TempFile tmp(path);
    tmp.write_all(content);
    tmp.copy_mode_from(path);
    tmp.sync_and_close();
    tmp.rename_to(path);
}

#else

void write_file_atomic(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::path tmp = path;
    tmp += L".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::system_error(EIO, std::generic_category(),
                                    "cannot create " + path_to_utf8(tmp));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw std::system_error(EIO, std::generic_category(),
                                    "cannot write " + path_to_utf8(tmp));
        }
    }
    if (!MoveFileExW(tmp.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "cannot replace " + path_to_utf8(path));
    }
}

#endif

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace qrpolicy::platform
