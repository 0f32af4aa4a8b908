#include "features/status_routes.hpp"

#include "platform/logging.hpp"

#include <glibmm/fileutils.h>

#include <utility>

namespace dazibao {
namespace {
HttpResponse page_response(const ConfigStore& store, const PageRenderer& renderer) {
    std::string error;
    auto html = renderer.render_html(store.snapshot(), error);
    if (!html) {
        logging::error("Error generating HTML for web request: " + error);
        return http::text_response(500, "Failed to generate page");
    }

    HttpResponse response;
    response.content_type = "text/html; charset=utf-8";
    response.body = std::move(*html);
    return response;
}

HttpResponse data_response(const ConfigStore& store, const PageRenderer& renderer) {
    HttpResponse response;
    response.content_type = "application/json";
    response.body = renderer.render_json(store.snapshot()) + "\n";
    return response;
}

HttpResponse icon_response(const PageRenderer& renderer) {
    if (!Glib::file_test(renderer.icon_path(), Glib::FileTest::IS_REGULAR)) {
        logging::warning("Icon file not found: " + renderer.icon_path());
        return http::text_response(404, "Icon not found");
    }

    HttpResponse response;
    try {
        response.body = Glib::file_get_contents(renderer.icon_path());
    } catch (const Glib::FileError& ex) {
        logging::error(std::string("Failed to read icon: ") + ex.what());
        return http::text_response(500, "Internal Server Error");
    }
    response.content_type = "image/png";
    return response;
}
}  // namespace

HttpResponse route_status_request(const HttpRequest& request, const ConfigStore& store,
                                  const PageRenderer& renderer) {
    const bool known = request.path == kPagePath || request.path == kDataPath || request.path == kIconPath;
    if (!known) {
        return http::text_response(404, "404 page not found");
    }
    if (request.method != "GET") {
        return http::text_response(405, "Method Not Allowed");
    }

    if (request.path == kDataPath) {
        return data_response(store, renderer);
    }
    if (request.path == kIconPath) {
        return icon_response(renderer);
    }
    return page_response(store, renderer);
}

RequestHandler make_status_handler(std::shared_ptr<ConfigStore> store, PageRenderer renderer) {
    return [store = std::move(store), renderer = std::move(renderer)](const HttpRequest& request) {
        return route_status_request(request, *store, renderer);
    };
}
}  // namespace dazibao
