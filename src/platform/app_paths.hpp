#ifndef DAZIBAO_PLATFORM_APP_PATHS_HPP
#define DAZIBAO_PLATFORM_APP_PATHS_HPP

#include <optional>
#include <string>

namespace dazibao {
struct AppPaths {
    std::string data_dir;
    std::string config_file;
    std::string template_file;
    std::string icons_dir;
    std::string icon_file;
    std::string lock_file;
    std::string static_page;
};

AppPaths app_paths_for(const std::string& data_dir);

// ~/.dazibao, or an error when the home directory cannot be determined.
std::optional<AppPaths> resolve_app_paths(std::string& error);

bool ensure_directory(const std::string& path, std::string& error);

// Creates the data directory and installs template.html and icons/ from
// source_dir when present there. fallback_template is written only when no
// template exists yet.
bool install_assets(const AppPaths& paths, const std::string& source_dir, const std::string& fallback_template,
                    std::string& error);

// Writes content to path, creating parent directories first.
bool write_file_with_parents(const std::string& path, const std::string& content, std::string& error);

// Single-instance marker: a file created exclusively and holding our PID.
class InstanceLock {
public:
    InstanceLock() = default;
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    bool acquire(const std::string& path, std::string& error);
    void release();
    bool held() const { return m_fd >= 0; }

private:
    int m_fd = -1;
    std::string m_path;
};
}  // namespace dazibao

#endif
