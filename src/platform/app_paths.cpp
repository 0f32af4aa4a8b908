#include "platform/app_paths.hpp"

#include "platform/logging.hpp"

#include <glib/gstdio.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace dazibao {
namespace {
bool copy_file_contents(const std::string& from, const std::string& to, std::string& error) {
    try {
        Glib::file_set_contents(to, Glib::file_get_contents(from));
    } catch (const Glib::FileError& ex) {
        error = "failed to copy " + from + " to " + to + ": " + ex.what();
        return false;
    }
    return true;
}
}  // namespace

AppPaths app_paths_for(const std::string& data_dir) {
    AppPaths paths;
    paths.data_dir = data_dir;
    paths.config_file = Glib::build_filename(data_dir, "config.json");
    paths.template_file = Glib::build_filename(data_dir, "template.html");
    paths.icons_dir = Glib::build_filename(data_dir, "icons");
    paths.icon_file = Glib::build_filename(paths.icons_dir, "dazibao.png");
    paths.lock_file = Glib::build_filename(data_dir, "dazibao.lock");
    paths.static_page = Glib::build_filename(data_dir, "index.html");
    return paths;
}

std::optional<AppPaths> resolve_app_paths(std::string& error) {
    const std::string home = Glib::get_home_dir();
    if (home.empty()) {
        error = "failed to get user home directory";
        return std::nullopt;
    }
    return app_paths_for(Glib::build_filename(home, ".dazibao"));
}

bool ensure_directory(const std::string& path, std::string& error) {
    if (g_mkdir_with_parents(path.c_str(), 0755) != 0) {
        error = "failed to create directory " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool install_assets(const AppPaths& paths, const std::string& source_dir, const std::string& fallback_template,
                    std::string& error) {
    if (!ensure_directory(paths.data_dir, error)) {
        return false;
    }

    const std::string source_template = Glib::build_filename(source_dir, "template.html");
    if (Glib::file_test(source_template, Glib::FileTest::IS_REGULAR)) {
        logging::info("Copying template.html from " + source_dir + " to " + paths.template_file + ".");
        if (!copy_file_contents(source_template, paths.template_file, error)) {
            return false;
        }
    } else if (!Glib::file_test(paths.template_file, Glib::FileTest::EXISTS)) {
        logging::info("Writing built-in template to " + paths.template_file + ".");
        try {
            Glib::file_set_contents(paths.template_file, fallback_template);
        } catch (const Glib::FileError& ex) {
            error = "failed to write template " + paths.template_file + ": " + ex.what();
            return false;
        }
    }

    const std::string source_icons = Glib::build_filename(source_dir, "icons");
    if (Glib::file_test(source_icons, Glib::FileTest::IS_DIR) &&
        !Glib::file_test(paths.icons_dir, Glib::FileTest::EXISTS)) {
        logging::info("Copying icons from " + source_icons + " to " + paths.icons_dir);
        std::error_code ec;
        std::filesystem::copy(source_icons, paths.icons_dir, std::filesystem::copy_options::recursive, ec);
        if (ec) {
            error = "failed to copy icons directory: " + ec.message();
            return false;
        }
    }
    return true;
}

bool write_file_with_parents(const std::string& path, const std::string& content, std::string& error) {
    const std::string absolute = std::filesystem::absolute(path).string();
    const std::string dir = Glib::path_get_dirname(absolute);
    if (!ensure_directory(dir, error)) {
        return false;
    }
    try {
        Glib::file_set_contents(absolute, content);
    } catch (const Glib::FileError& ex) {
        error = "could not write " + absolute + ": " + ex.what();
        return false;
    }
    return true;
}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::acquire(const std::string& path, std::string& error) {
    if (held()) {
        return true;
    }

    int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            error = "Another instance of dazibao is already running. Lock file exists: " + path;
        } else {
            error = "Failed to create lock file " + path + ": " + std::strerror(errno);
        }
        return false;
    }

    const std::string pid = std::to_string(getpid());
    if (write(fd, pid.c_str(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        error = std::string("Failed to write PID to lock file: ") + std::strerror(errno);
        close(fd);
        unlink(path.c_str());
        return false;
    }

    m_fd = fd;
    m_path = path;
    logging::info("Acquired lock: " + path + " (PID: " + pid + ")");
    return true;
}

void InstanceLock::release() {
    if (!held()) {
        return;
    }

    close(m_fd);
    m_fd = -1;
    if (unlink(m_path.c_str()) != 0) {
        logging::warning("Failed to remove lock file " + m_path + ": " + std::strerror(errno));
    } else {
        logging::info("Released lock: " + m_path);
    }
}
}  // namespace dazibao
