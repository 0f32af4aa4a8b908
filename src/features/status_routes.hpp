#ifndef DAZIBAO_FEATURES_STATUS_ROUTES_HPP
#define DAZIBAO_FEATURES_STATUS_ROUTES_HPP

#include "core/config_store.hpp"
#include "features/page_renderer.hpp"
#include "platform/http_server.hpp"

#include <memory>

namespace dazibao {
constexpr const char* kPagePath = "/";
constexpr const char* kDataPath = "/data";
constexpr const char* kIconPath = "/icons/dazibao.png";

// Every route renders from one snapshot taken per request.
HttpResponse route_status_request(const HttpRequest& request, const ConfigStore& store,
                                  const PageRenderer& renderer);

RequestHandler make_status_handler(std::shared_ptr<ConfigStore> store, PageRenderer renderer);
}

#endif
