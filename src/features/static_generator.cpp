#include "features/static_generator.hpp"

#include "core/config_store.hpp"
#include "features/block_scheduler.hpp"
#include "platform/logging.hpp"

#include <utility>

namespace dazibao {
StaticPageGenerator::StaticPageGenerator(AppPaths paths, std::string version)
    : m_paths(std::move(paths)),
      m_version(std::move(version)),
      m_renderer(m_paths.template_file, m_paths.icon_file) {}

std::optional<std::string> StaticPageGenerator::generate(std::string& error) const {
    bool created = false;
    auto tree = load_or_create_configuration(m_paths.config_file, created, error);
    if (!tree) {
        error = "could not load config: " + error;
        return std::nullopt;
    }
    tree->version = m_version;

    ConfigStore store(std::move(*tree), m_paths.config_file);
    const ConfigurationTree initial = store.snapshot();
    for (std::size_t i = 0; i < initial.blocks.size(); ++i) {
        run_tick(store, i, initial.blocks[i]);
    }

    return m_renderer.render_html(store.snapshot(), error);
}

bool StaticPageGenerator::generate_to_file(const std::string& output_path, std::string& error) const {
    auto html = generate(error);
    if (!html) {
        return false;
    }

    const std::string path = resolve_output_path(output_path);
    if (!write_file_with_parents(path, *html, error)) {
        return false;
    }
    logging::info("Successfully updated " + path);
    return true;
}

std::string StaticPageGenerator::resolve_output_path(const std::string& output_path) const {
    return output_path.empty() ? m_paths.static_page : output_path;
}
}  // namespace dazibao
