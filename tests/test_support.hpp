#ifndef DAZIBAO_TESTS_TEST_SUPPORT_HPP
#define DAZIBAO_TESTS_TEST_SUPPORT_HPP

#include <glib.h>

#include <cassert>
#include <filesystem>
#include <string>

namespace test_support {
inline std::string make_temp_dir() {
    GError* error = nullptr;
    gchar* dir = g_dir_make_tmp("dazibao-test-XXXXXX", &error);
    assert(dir != nullptr);
    std::string path(dir);
    g_free(dir);
    return path;
}

inline void remove_tree(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}
}  // namespace test_support

#endif
