#include "core/config_store.hpp"

#include "core/config_codec.hpp"
#include "platform/logging.hpp"

#include <glibmm/fileutils.h>

#include <utility>

namespace dazibao {
ConfigStore::ConfigStore(ConfigurationTree tree, std::string path)
    : m_tree(std::move(tree)), m_path(std::move(path)) {}

ConfigurationTree ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree;
}

bool ConfigStore::mutate(const std::function<void(ConfigurationTree&)>& fn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    fn(m_tree);
    return persist_locked();
}

bool ConfigStore::persist_locked() {
    std::string error;
    if (!codec::save_to_file(m_tree, m_path, error)) {
        logging::error("Error saving config: " + error);
        return false;
    }
    return true;
}

std::optional<ConfigurationTree> load_or_create_configuration(const std::string& path, bool& created,
                                                              std::string& error) {
    created = false;
    if (!Glib::file_test(path, Glib::FileTest::EXISTS)) {
        logging::info(path + " not found, creating with default blocks.");
        ConfigurationTree tree = default_configuration();
        if (!codec::save_to_file(tree, path, error)) {
            error = "failed to save initial default config: " + error;
            return std::nullopt;
        }
        created = true;
        return tree;
    }
    return codec::load_from_file(path, error);
}
}  // namespace dazibao
