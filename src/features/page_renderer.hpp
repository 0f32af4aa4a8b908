#ifndef DAZIBAO_FEATURES_PAGE_RENDERER_HPP
#define DAZIBAO_FEATURES_PAGE_RENDERER_HPP

#include "core/models.hpp"

#include <optional>
#include <string>

namespace dazibao {
namespace render {
constexpr const char* kConfigJsonPlaceholder = "{{.ConfigJSON}}";
constexpr const char* kIconDataUriPlaceholder = "{{.IconDataURI}}";

const std::string& default_template();

// Escapes "</" so the JSON cannot close the surrounding <script> element.
std::string json_for_script(const std::string& json);
std::string replace_all(std::string text, const std::string& from, const std::string& to);
std::string fill_template(const std::string& page_template, const std::string& config_json,
                          const std::string& icon_data_uri);
}

class PageRenderer {
public:
    PageRenderer(std::string template_path, std::string icon_path);

    std::optional<std::string> render_html(const ConfigurationTree& snapshot, std::string& error) const;
    std::string render_json(const ConfigurationTree& snapshot) const;

    // "data:image/png;base64,..." or an empty string when the icon is unreadable.
    std::string icon_data_uri() const;

    const std::string& icon_path() const { return m_icon_path; }

private:
    std::string m_template_path;
    std::string m_icon_path;
};
}  // namespace dazibao

#endif
