#ifndef DAZIBAO_CORE_MODELS_HPP
#define DAZIBAO_CORE_MODELS_HPP

#include <chrono>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dazibao {
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Styling is opaque to the engine: keys and values are passed through unchanged.
using StyleMap = std::map<std::string, std::string>;

constexpr int kDefaultPort = 8080;

struct CommandSpec {
    std::string label;
    std::string command;
    std::string output;
};

struct SingleBody {
    std::string command;
    std::string output;
};

struct GroupBody {
    std::vector<CommandSpec> commands;
};

using BlockBody = std::variant<SingleBody, GroupBody>;

struct Block {
    std::string title;
    int interval = 0;
    BlockBody body;
    Timestamp last_updated{};
    StyleMap colors;

    bool is_group() const { return std::holds_alternative<GroupBody>(body); }
    const char* type_name() const { return is_group() ? "group" : "single"; }
    std::size_t slot_count() const;
};

struct ConfigurationTree {
    std::vector<Block> blocks;
    Timestamp last_updated{};
    int port = 0;
    std::string version;
    StyleMap colors;
};

Timestamp now_timestamp();

// Returns the current time, or previous + 1us when the clock has not moved past it.
Timestamp next_timestamp_after(Timestamp previous);

ConfigurationTree default_configuration();

bool operator==(const CommandSpec& lhs, const CommandSpec& rhs);
bool operator==(const SingleBody& lhs, const SingleBody& rhs);
bool operator==(const GroupBody& lhs, const GroupBody& rhs);
bool operator==(const Block& lhs, const Block& rhs);
bool operator==(const ConfigurationTree& lhs, const ConfigurationTree& rhs);
}  // namespace dazibao

#endif
