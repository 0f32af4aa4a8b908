#ifndef DAZIBAO_CORE_CONFIG_CODEC_HPP
#define DAZIBAO_CORE_CONFIG_CODEC_HPP

#include "core/models.hpp"

#include <optional>
#include <string>

namespace dazibao::codec {
std::string format_timestamp(Timestamp timestamp);
std::optional<Timestamp> parse_timestamp(const std::string& text);

std::string to_json(const ConfigurationTree& tree, bool pretty);
std::optional<ConfigurationTree> from_json(const std::string& data, std::string& error);

// Replaces the whole file in one write.
bool save_to_file(const ConfigurationTree& tree, const std::string& path, std::string& error);
std::optional<ConfigurationTree> load_from_file(const std::string& path, std::string& error);
}

#endif
