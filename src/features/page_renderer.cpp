#include "features/page_renderer.hpp"

#include "core/config_codec.hpp"
#include "platform/logging.hpp"

#include <glibmm/base64.h>
#include <glibmm/fileutils.h>

#include <utility>

namespace dazibao {
namespace {
const char* const kDefaultTemplate = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Dazibao</title>
<link rel="icon" type="image/png" href="{{.IconDataURI}}">
<style>
  body { font-family: sans-serif; margin: 0; padding: 1em; }
  header { display: flex; align-items: center; gap: 0.5em; margin-bottom: 1em; }
  header img { width: 32px; height: 32px; }
  #blocks { display: grid; grid-template-columns: repeat(auto-fill, minmax(320px, 1fr)); gap: 1em; }
  .block { border-radius: 6px; overflow: hidden; box-shadow: 0 1px 3px rgba(0, 0, 0, 0.2); }
  .block h2 { margin: 0; padding: 0.4em 0.6em; }
  .block pre { margin: 0; padding: 0.6em; white-space: pre-wrap; }
  .block table { width: 100%; border-collapse: collapse; }
  .block td { padding: 0.3em 0.6em; vertical-align: top; }
  .updated { font-size: 0.75em; padding: 0.2em 0.6em; opacity: 0.6; }
  footer { margin-top: 1em; font-size: 0.8em; opacity: 0.6; }
</style>
</head>
<body>
<header><img src="{{.IconDataURI}}" alt=""><h1>Dazibao</h1></header>
<div id="blocks"></div>
<footer id="footer"></footer>
<script>
const initialConfig = {{.ConfigJSON}};

function styled(element, styles) {
  for (const [property, value] of Object.entries(styles)) {
    if (value) element.style[property] = value;
  }
  return element;
}

function cell(tag, text, colors, prefix) {
  const element = document.createElement(tag);
  element.textContent = text;
  return styled(element, {
    color: colors[prefix + "_color"],
    background: colors[prefix + "_background"],
    fontSize: colors[prefix + "_font_size"],
  });
}

function renderBlock(block) {
  const colors = block.colors || {};
  const container = styled(document.createElement("section"), { background: colors.background });
  container.className = "block";
  container.appendChild(cell("h2", block.title, colors, "title"));

  if (block.type === "group") {
    const table = document.createElement("table");
    for (const command of block.commands || []) {
      const row = table.insertRow();
      row.appendChild(cell("td", command.label, colors, "label"));
      row.appendChild(cell("td", command.output, colors, "value"));
    }
    container.appendChild(table);
  } else {
    container.appendChild(cell("pre", block.output || "", colors, "value"));
  }

  const updated = document.createElement("div");
  updated.className = "updated";
  updated.textContent = "Updated " + new Date(block.last_updated).toLocaleTimeString();
  container.appendChild(updated);
  return container;
}

function render(config) {
  if (!config) return;
  document.body.style.background = (config.colors || {}).page_background || "";
  const blocks = document.getElementById("blocks");
  blocks.replaceChildren(...(config.blocks || []).map(renderBlock));
  document.getElementById("footer").textContent =
    "Dazibao " + (config.version || "") + " - last update " + new Date(config.last_updated).toLocaleString();
}

render(initialConfig);
if (location.protocol.startsWith("http")) {
  setInterval(() => {
    fetch("/data").then((response) => response.json()).then(render).catch(() => {});
  }, 2000);
}
</script>
</body>
</html>
)HTML";
}  // namespace

const std::string& render::default_template() {
    static const std::string page_template(kDefaultTemplate);
    return page_template;
}

std::string render::json_for_script(const std::string& json) {
    return replace_all(json, "</", "<\\/");
}

std::string render::replace_all(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.length(), to);
        pos += to.length();
    }
    return text;
}

std::string render::fill_template(const std::string& page_template, const std::string& config_json,
                                  const std::string& icon_data_uri) {
    std::string page = replace_all(page_template, kIconDataUriPlaceholder, icon_data_uri);
    return replace_all(std::move(page), kConfigJsonPlaceholder, json_for_script(config_json));
}

PageRenderer::PageRenderer(std::string template_path, std::string icon_path)
    : m_template_path(std::move(template_path)), m_icon_path(std::move(icon_path)) {}

std::optional<std::string> PageRenderer::render_html(const ConfigurationTree& snapshot, std::string& error) const {
    std::string page_template;
    try {
        page_template = Glib::file_get_contents(m_template_path);
    } catch (const Glib::FileError& ex) {
        error = "failed to read template file " + m_template_path + ": " + ex.what();
        return std::nullopt;
    }

    return render::fill_template(page_template, codec::to_json(snapshot, false), icon_data_uri());
}

std::string PageRenderer::render_json(const ConfigurationTree& snapshot) const {
    return codec::to_json(snapshot, false);
}

std::string PageRenderer::icon_data_uri() const {
    std::string icon;
    try {
        icon = Glib::file_get_contents(m_icon_path);
    } catch (const Glib::FileError& ex) {
        logging::warning(std::string("could not read icon file: ") + ex.what());
        return "";
    }
    return "data:image/png;base64," + Glib::Base64::encode(icon);
}
}  // namespace dazibao
