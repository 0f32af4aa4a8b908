#include "core/config_codec.hpp"
#include "features/page_renderer.hpp"
#include "features/status_routes.hpp"
#include "test_support.hpp"

#include <glibmm/fileutils.h>
#include <glibmm/init.h>
#include <glibmm/miscutils.h>

#include <cassert>
#include <memory>
#include <string>

namespace {
bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

dazibao::ConfigurationTree sample_tree() {
    dazibao::ConfigurationTree tree;
    tree.port = 8080;
    tree.version = "0.7-test";
    dazibao::Block block;
    block.title = "Greeting";
    block.interval = 5;
    block.body = dazibao::SingleBody{"echo hi", "hi </script><b>"};
    tree.blocks.push_back(block);
    return tree;
}
}  // namespace

int main() {
    Glib::init();
    const std::string dir = test_support::make_temp_dir();
    const std::string template_path = Glib::build_filename(dir, "template.html");
    const std::string icon_path = Glib::build_filename(dir, "dazibao.png");

    {
        assert(dazibao::render::json_for_script("{\"a\":\"</script>\"}") == "{\"a\":\"<\\/script>\"}");
        assert(dazibao::render::replace_all("aXbXc", "X", "--") == "a--b--c");
        assert(dazibao::render::replace_all("abc", "", "x") == "abc");

        const std::string page = dazibao::render::fill_template(
            "<img src=\"{{.IconDataURI}}\"><script>var c = {{.ConfigJSON}}; var d = {{.ConfigJSON}};</script>",
            "{\"x\":1}", "data:image/png;base64,AA==");
        assert(page == "<img src=\"data:image/png;base64,AA==\"><script>var c = {\"x\":1}; var d = {\"x\":1};</script>");
    }

    {
        const std::string& page_template = dazibao::render::default_template();
        assert(contains(page_template, dazibao::render::kConfigJsonPlaceholder));
        assert(contains(page_template, dazibao::render::kIconDataUriPlaceholder));
    }

    {
        dazibao::PageRenderer renderer(template_path, icon_path);
        std::string error;
        assert(!renderer.render_html(sample_tree(), error).has_value());
        assert(contains(error, template_path));
        assert(renderer.icon_data_uri().empty());

        Glib::file_set_contents(template_path, "<p>{{.IconDataURI}}</p><script>{{.ConfigJSON}}</script>");
        Glib::file_set_contents(icon_path, "abc");
        assert(renderer.icon_data_uri() == "data:image/png;base64,YWJj");

        auto html = renderer.render_html(sample_tree(), error);
        assert(html.has_value());
        assert(contains(*html, "<p>data:image/png;base64,YWJj</p>"));
        assert(contains(*html, "\"title\":\"Greeting\""));
        assert(contains(*html, "hi <\\/script><b>"));
        assert(!contains(*html, "{{.ConfigJSON}}"));
    }

    {
        dazibao::PageRenderer renderer(template_path, icon_path);
        const auto tree = sample_tree();
        std::string error;
        auto parsed = dazibao::codec::from_json(renderer.render_json(tree), error);
        assert(parsed.has_value());
        assert(*parsed == tree);
    }

    {
        auto store = std::make_shared<dazibao::ConfigStore>(sample_tree(), Glib::build_filename(dir, "config.json"));
        dazibao::PageRenderer renderer(template_path, icon_path);

        auto data = dazibao::route_status_request({"GET", "/data"}, *store, renderer);
        assert(data.status == 200);
        assert(data.content_type == "application/json");
        assert(contains(data.body, "\"version\":\"0.7-test\""));

        auto page = dazibao::route_status_request({"GET", "/"}, *store, renderer);
        assert(page.status == 200);
        assert(contains(page.content_type, "text/html"));

        auto icon = dazibao::route_status_request({"GET", "/icons/dazibao.png"}, *store, renderer);
        assert(icon.status == 200);
        assert(icon.content_type == "image/png");
        assert(icon.body == "abc");

        assert(dazibao::route_status_request({"GET", "/missing"}, *store, renderer).status == 404);
        assert(dazibao::route_status_request({"POST", "/data"}, *store, renderer).status == 405);

        auto handler = dazibao::make_status_handler(store, dazibao::PageRenderer(template_path,
                                                    Glib::build_filename(dir, "none.png")));
        assert(handler({"GET", "/icons/dazibao.png"}).status == 404);

        dazibao::PageRenderer broken(Glib::build_filename(dir, "none.html"), icon_path);
        assert(dazibao::route_status_request({"GET", "/"}, *store, broken).status == 500);
    }

    test_support::remove_tree(dir);
    return 0;
}
