#include "platform/variable_resolver.hpp"

#include <glibmm/datetime.h>
#include <glibmm/miscutils.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <netinet/in.h>

#ifndef DAZIBAO_VERSION
#define DAZIBAO_VERSION "0.0-dev"
#endif

namespace dazibao::variables {
namespace {
std::string now_formatted(const char* format) {
    return Glib::DateTime::create_now_local().format(format).raw();
}

std::string errno_message(int error_number) {
    return std::string("Error: ") + std::strerror(error_number);
}
}  // namespace

bool is_variable_reference(const std::string& command) {
    return command.size() > 1 && command[0] == kSentinel;
}

std::string app_name() {
    return "Dazibao";
}

std::string app_version() {
    return DAZIBAO_VERSION;
}

std::string first_ipv4_address() {
    ifaddrs* addresses = nullptr;
    if (getifaddrs(&addresses) != 0) {
        return errno_message(errno);
    }

    std::string result = kNotAvailable;
    for (ifaddrs* entry = addresses; entry != nullptr; entry = entry->ifa_next) {
        if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        const auto* inet = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
        if ((ntohl(inet->sin_addr.s_addr) >> 24) == IN_LOOPBACKNET) {
            continue;
        }

        char text[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &inet->sin_addr, text, sizeof(text)) != nullptr) {
            result = text;
            break;
        }
    }

    freeifaddrs(addresses);
    return result;
}

std::string resolve(const std::string& name) {
    if (name == "%hostname") {
        std::string host = Glib::get_host_name();
        return host.empty() ? "Error: hostname unavailable" : host;
    }
    if (name == "%time") return now_formatted("%H:%M:%S");
    if (name == "%date") return now_formatted("%Y-%m-%d");
    if (name == "%year") return now_formatted("%Y");
    if (name == "%month") return now_formatted("%m");
    if (name == "%day") return now_formatted("%d");
    if (name == "%dayname") return now_formatted("%A");
    if (name == "%hours") return now_formatted("%H");
    if (name == "%minutes") return now_formatted("%M");
    if (name == "%seconds") return now_formatted("%S");
    if (name == "%username") {
        std::string user = Glib::get_user_name();
        return user.empty() ? "Error: user name unavailable" : user;
    }
    if (name == "%ip_address") return first_ipv4_address();
    if (name == "%app_name") return app_name();
    if (name == "%app_version") return app_version();
    return kUnknownVariable;
}
}  // namespace dazibao::variables
