#ifndef DAZIBAO_PLATFORM_VARIABLE_RESOLVER_HPP
#define DAZIBAO_PLATFORM_VARIABLE_RESOLVER_HPP

#include <string>

namespace dazibao::variables {
constexpr char kSentinel = '%';
constexpr const char* kUnknownVariable = "Unknown variable";
constexpr const char* kNotAvailable = "N/A";

bool is_variable_reference(const std::string& command);

// Never fails: OS errors come back inline as "Error: ..." text.
std::string resolve(const std::string& name);

std::string app_name();
std::string app_version();
std::string first_ipv4_address();
}

#endif
