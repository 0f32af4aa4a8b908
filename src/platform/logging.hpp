#ifndef DAZIBAO_PLATFORM_LOGGING_HPP
#define DAZIBAO_PLATFORM_LOGGING_HPP

#include <string>

namespace dazibao::logging {
void info(const std::string& message);
void warning(const std::string& message);
void error(const std::string& message);
}

#endif
