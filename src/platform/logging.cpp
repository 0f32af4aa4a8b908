#include "platform/logging.hpp"

#include <glibmm/datetime.h>

#include <iostream>
#include <mutex>

namespace dazibao::logging {
namespace {
std::mutex g_log_mutex;

void write_line(const char* level, const std::string& message) {
    const std::string stamp = Glib::DateTime::create_now_local().format("%Y/%m/%d %H:%M:%S").raw();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << stamp << ' ';
    if (level) {
        std::cerr << level << ": ";
    }
    std::cerr << message << '\n';
}
}  // namespace

void info(const std::string& message) {
    write_line(nullptr, message);
}

void warning(const std::string& message) {
    write_line("Warning", message);
}

void error(const std::string& message) {
    write_line("Error", message);
}
}  // namespace dazibao::logging
