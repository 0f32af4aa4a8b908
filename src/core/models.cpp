#include "core/models.hpp"

namespace dazibao {
namespace {
StyleMap single_block_colors() {
    return {
        {"background", "#fff"},
        {"title_color", "#333"},
        {"title_background", "#eee"},
        {"title_font_size", "1.2em"},
        {"value_font_size", "1em"},
    };
}

Block make_single(const std::string& title, const std::string& command, int interval) {
    Block block;
    block.title = title;
    block.interval = interval;
    block.body = SingleBody{command, ""};
    block.colors = single_block_colors();
    return block;
}
}  // namespace

std::size_t Block::slot_count() const {
    if (const auto* group = std::get_if<GroupBody>(&body)) {
        return group->commands.size();
    }
    return 1;
}

Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

Timestamp next_timestamp_after(Timestamp previous) {
    Timestamp now = now_timestamp();
    if (now > previous) {
        return now;
    }
    return previous + std::chrono::microseconds(1);
}

ConfigurationTree default_configuration() {
    ConfigurationTree tree;
    tree.blocks.push_back(make_single("Uptime", "uptime", 5));
    tree.blocks.push_back(make_single("Disk Usage", "df -h", 10));

    Block info;
    info.title = "System Info";
    info.interval = 5;
    info.body = GroupBody{{
        {"Hostname", "%hostname", ""},
        {"Current Time", "%time", ""},
        {"Current Date", "%date", ""},
        {"Username", "%username", ""},
        {"IP Address", "%ip_address", ""},
    }};
    info.colors = {
        {"background", "#f9f9f9"},
        {"title_color", "#0056b3"},
        {"title_background", "#e0f2f7"},
        {"title_font_size", "1.2em"},
        {"label_color", "#555"},
        {"label_background", "#f0f0f0"},
        {"label_font_size", "1em"},
        {"value_color", "#222"},
        {"value_background", "#fff"},
        {"value_font_size", "1em"},
    };
    tree.blocks.push_back(std::move(info));

    tree.last_updated = now_timestamp();
    tree.port = kDefaultPort;
    tree.colors = {{"page_background", "#f0f0f0"}};
    return tree;
}

bool operator==(const CommandSpec& lhs, const CommandSpec& rhs) {
    return lhs.label == rhs.label && lhs.command == rhs.command && lhs.output == rhs.output;
}

bool operator==(const SingleBody& lhs, const SingleBody& rhs) {
    return lhs.command == rhs.command && lhs.output == rhs.output;
}

bool operator==(const GroupBody& lhs, const GroupBody& rhs) {
    return lhs.commands == rhs.commands;
}

bool operator==(const Block& lhs, const Block& rhs) {
    return lhs.title == rhs.title && lhs.interval == rhs.interval && lhs.body == rhs.body &&
           lhs.last_updated == rhs.last_updated && lhs.colors == rhs.colors;
}

bool operator==(const ConfigurationTree& lhs, const ConfigurationTree& rhs) {
    return lhs.blocks == rhs.blocks && lhs.last_updated == rhs.last_updated && lhs.port == rhs.port &&
           lhs.version == rhs.version && lhs.colors == rhs.colors;
}
}  // namespace dazibao
