#ifndef DAZIBAO_FEATURES_STATIC_GENERATOR_HPP
#define DAZIBAO_FEATURES_STATIC_GENERATOR_HPP

#include "features/page_renderer.hpp"
#include "platform/app_paths.hpp"

#include <optional>
#include <string>

namespace dazibao {
// Produces the page without a server: load the config from disk, run every
// block once, save the results and render.
class StaticPageGenerator {
public:
    StaticPageGenerator(AppPaths paths, std::string version);

    std::optional<std::string> generate(std::string& error) const;

    // Generates and writes to output_path, or to the default index.html when empty.
    bool generate_to_file(const std::string& output_path, std::string& error) const;

    std::string resolve_output_path(const std::string& output_path) const;

private:
    AppPaths m_paths;
    std::string m_version;
    PageRenderer m_renderer;
};
}  // namespace dazibao

#endif
