// ==============================================================================
// test_platform_basic.cpp - Базовые тесты платформы
// ==============================================================================
//
// Минимальная проверка сборки и работоспособности без GoogleTest.
//
// ==============================================================================

#include "qrpolicy/platform.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>

namespace {

void test_path_roundtrip() {
    std::cout << "Testing path UTF-8 roundtrip... ";

    std::string original = "/etc/qubes/policy.d/include/admin-local-rwx";
    auto path = qrpolicy::platform::path_from_utf8(original);
    std::string result = qrpolicy::platform::path_to_utf8(path);

#ifndef _WIN32
    assert(result == original && "Path roundtrip should preserve string on Unix");
#else
    assert(result.find("admin-local-rwx") != std::string::npos && "Path should contain filename");
#endif
    (void)result;

    std::cout << "PASS\n";
}

void test_os_name() {
    std::cout << "Testing os_name... ";

    std::string os = qrpolicy::platform::os_name();
    assert(!os.empty() && "OS name should not be empty");
#if defined(__linux__)
    assert(os == "Linux" && "OS should be Linux");
#endif
    (void)os;

    std::cout << "PASS\n";
}

void test_write_and_read() {
    std::cout << "Testing atomic write and read... ";

    const auto path = std::filesystem::temp_directory_path() / "qrpolicy_platform_basic.policy";
    qrpolicy::platform::write_file_atomic(path, "qubes.Foo * work vault allow\n");
    [[maybe_unused]] const std::string content = qrpolicy::platform::read_file(path);
    assert(content == "qubes.Foo * work vault allow\n" && "Content should survive roundtrip");
    std::filesystem::remove(path);

    std::cout << "PASS\n";
}

}  // anonymous namespace

int main() {
    std::cout << "=== qrpolicy Platform Basic Tests ===\n\n";

    test_path_roundtrip();
    test_os_name();
    test_write_and_read();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
