#ifndef DAZIBAO_CORE_CONFIG_STORE_HPP
#define DAZIBAO_CORE_CONFIG_STORE_HPP

#include "core/models.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace dazibao {
// Owns the configuration tree. Every read for rendering and every write from a
// scheduler goes through the same mutex; persistence happens inside it too.
class ConfigStore {
public:
    ConfigStore(ConfigurationTree tree, std::string path);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    ConfigurationTree snapshot() const;

    // Applies fn and persists the result before releasing the lock. Returns
    // false when the file could not be written; the in-memory change stays.
    bool mutate(const std::function<void(ConfigurationTree&)>& fn);

    const std::string& path() const { return m_path; }

private:
    bool persist_locked();

    mutable std::mutex m_mutex;
    ConfigurationTree m_tree;
    std::string m_path;
};

// Reads the tree from path; a missing file is replaced by the default blocks,
// which are written out before returning.
std::optional<ConfigurationTree> load_or_create_configuration(const std::string& path, bool& created,
                                                              std::string& error);
}  // namespace dazibao

#endif
