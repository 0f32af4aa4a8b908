#include "core/config_codec.hpp"

#include <glibmm/datetime.h>
#include <glibmm/fileutils.h>
#include <glibmm/timezone.h>
#include <json-glib/json-glib.h>

#include <limits>
#include <memory>

namespace dazibao::codec {
namespace {
struct GObjectDeleter {
    void operator()(gpointer object) const { g_object_unref(object); }
};

using ParserPtr = std::unique_ptr<JsonParser, GObjectDeleter>;

bool holds_value_of(JsonNode* node, GType type) {
    return node && JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == type;
}

// Absent members read as empty; members of the wrong type are an error.
bool read_string(JsonObject* obj, const char* member, std::string& out, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (JSON_NODE_HOLDS_NULL(node)) {
        return true;
    }
    if (!holds_value_of(node, G_TYPE_STRING)) {
        error = std::string("'") + member + "' must be a string";
        return false;
    }
    out = json_node_get_string(node);
    return true;
}

bool read_int(JsonObject* obj, const char* member, int& out, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (JSON_NODE_HOLDS_NULL(node)) {
        return true;
    }
    if (!holds_value_of(node, G_TYPE_INT64)) {
        error = std::string("'") + member + "' must be an integer";
        return false;
    }
    const gint64 value = json_node_get_int(node);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        error = std::string("'") + member + "' is out of range: " + std::to_string(value);
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool read_timestamp(JsonObject* obj, const char* member, Timestamp& out, std::string& error) {
    std::string text;
    if (!read_string(obj, member, text, error)) {
        return false;
    }
    if (text.empty()) {
        return true;
    }
    auto parsed = parse_timestamp(text);
    if (!parsed) {
        error = std::string("'") + member + "' is not an RFC3339 timestamp: " + text;
        return false;
    }
    out = *parsed;
    return true;
}

bool read_styles(JsonObject* obj, const char* member, StyleMap& out, std::string& error) {
    if (!json_object_has_member(obj, member)) {
        return true;
    }
    JsonNode* node = json_object_get_member(obj, member);
    if (JSON_NODE_HOLDS_NULL(node)) {
        return true;
    }
    if (!JSON_NODE_HOLDS_OBJECT(node)) {
        error = std::string("'") + member + "' must be an object";
        return false;
    }

    JsonObject* styles = json_node_get_object(node);
    GList* names = json_object_get_members(styles);
    bool ok = true;
    for (GList* it = names; it != nullptr; it = it->next) {
        const char* name = static_cast<const char*>(it->data);
        std::string value;
        if (!read_string(styles, name, value, error)) {
            error = std::string(member) + ": " + error;
            ok = false;
            break;
        }
        out[name] = value;
    }
    g_list_free(names);
    return ok;
}

bool read_group_commands(JsonObject* obj, GroupBody& group, std::string& error) {
    if (!json_object_has_member(obj, "commands")) {
        return true;
    }
    JsonNode* node = json_object_get_member(obj, "commands");
    if (JSON_NODE_HOLDS_NULL(node)) {
        return true;
    }
    if (!JSON_NODE_HOLDS_ARRAY(node)) {
        error = "'commands' must be an array";
        return false;
    }

    JsonArray* array = json_node_get_array(node);
    guint length = json_array_get_length(array);
    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!JSON_NODE_HOLDS_OBJECT(element)) {
            error = "commands[" + std::to_string(i) + "] must be an object";
            return false;
        }
        JsonObject* cmd_obj = json_node_get_object(element);
        CommandSpec spec;
        if (!read_string(cmd_obj, "label", spec.label, error) ||
            !read_string(cmd_obj, "command", spec.command, error) ||
            !read_string(cmd_obj, "output", spec.output, error)) {
            error = "commands[" + std::to_string(i) + "]: " + error;
            return false;
        }
        group.commands.push_back(std::move(spec));
    }
    return true;
}

bool read_block(JsonNode* node, Block& block, std::string& error) {
    if (!JSON_NODE_HOLDS_OBJECT(node)) {
        error = "must be an object";
        return false;
    }
    JsonObject* obj = json_node_get_object(node);

    std::string type;
    if (!read_string(obj, "type", type, error) ||
        !read_string(obj, "title", block.title, error) ||
        !read_int(obj, "interval", block.interval, error) ||
        !read_timestamp(obj, "last_updated", block.last_updated, error) ||
        !read_styles(obj, "colors", block.colors, error)) {
        return false;
    }

    if (block.interval <= 0) {
        error = "'interval' must be a positive number of seconds";
        return false;
    }

    if (type == "single") {
        SingleBody single;
        if (!read_string(obj, "command", single.command, error) ||
            !read_string(obj, "output", single.output, error)) {
            return false;
        }
        block.body = std::move(single);
    } else if (type == "group") {
        GroupBody group;
        if (!read_group_commands(obj, group, error)) {
            return false;
        }
        block.body = std::move(group);
    } else {
        error = "unknown block type '" + type + "'";
        return false;
    }
    return true;
}

// Microseconds written after the seconds field, read from the text so that
// no floating point conversion is involved. Digits past the sixth are dropped.
gint64 fraction_micros(const std::string& text) {
    size_t time_start = text.find_first_of("Tt ");
    if (time_start == std::string::npos) {
        return 0;
    }
    size_t dot = text.find_first_of(".,", time_start);
    if (dot == std::string::npos) {
        return 0;
    }

    gint64 micros = 0;
    int digits = 0;
    for (size_t i = dot + 1; i < text.size() && g_ascii_isdigit(text[i]); ++i) {
        if (digits < 6) {
            micros = micros * 10 + (text[i] - '0');
            ++digits;
        }
    }
    for (; digits < 6; ++digits) {
        micros *= 10;
    }
    return micros;
}

void add_string_member(JsonBuilder* builder, const char* name, const std::string& value) {
    json_builder_set_member_name(builder, name);
    json_builder_add_string_value(builder, value.c_str());
}

void add_styles(JsonBuilder* builder, const StyleMap& styles) {
    json_builder_set_member_name(builder, "colors");
    json_builder_begin_object(builder);
    for (const auto& [name, value] : styles) {
        add_string_member(builder, name.c_str(), value);
    }
    json_builder_end_object(builder);
}

void add_block(JsonBuilder* builder, const Block& block) {
    json_builder_begin_object(builder);
    add_string_member(builder, "type", block.type_name());
    add_string_member(builder, "title", block.title);

    std::string single_output;
    if (const auto* single = std::get_if<SingleBody>(&block.body)) {
        if (!single->command.empty()) {
            add_string_member(builder, "command", single->command);
        }
        single_output = single->output;
    } else if (const auto* group = std::get_if<GroupBody>(&block.body)) {
        if (!group->commands.empty()) {
            json_builder_set_member_name(builder, "commands");
            json_builder_begin_array(builder);
            for (const auto& spec : group->commands) {
                json_builder_begin_object(builder);
                add_string_member(builder, "label", spec.label);
                add_string_member(builder, "command", spec.command);
                add_string_member(builder, "output", spec.output);
                json_builder_end_object(builder);
            }
            json_builder_end_array(builder);
        }
    }

    json_builder_set_member_name(builder, "interval");
    json_builder_add_int_value(builder, block.interval);
    if (!single_output.empty()) {
        add_string_member(builder, "output", single_output);
    }
    add_string_member(builder, "last_updated", format_timestamp(block.last_updated));
    add_styles(builder, block.colors);
    json_builder_end_object(builder);
}
}  // namespace

std::string format_timestamp(Timestamp timestamp) {
    const auto micros = timestamp.time_since_epoch().count();
    gint64 seconds = micros / G_USEC_PER_SEC;
    gint64 remainder = micros % G_USEC_PER_SEC;
    if (remainder < 0) {
        remainder += G_USEC_PER_SEC;
        seconds -= 1;
    }
    auto utc = Glib::DateTime::create_now_utc(seconds).add(remainder);
    auto local = utc.to_local();
    // Times near year 1 may not be representable in a zone behind UTC.
    return (local ? local : utc).format_iso8601().raw();
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    auto parsed = Glib::DateTime::create_from_iso8601(text, Glib::TimeZone::create_utc());
    if (!parsed) {
        return std::nullopt;
    }
    const gint64 micros = parsed.to_unix() * G_USEC_PER_SEC + fraction_micros(text);
    return Timestamp(std::chrono::microseconds(micros));
}

std::string to_json(const ConfigurationTree& tree, bool pretty) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "blocks");
    json_builder_begin_array(builder);
    for (const auto& block : tree.blocks) {
        add_block(builder, block);
    }
    json_builder_end_array(builder);

    add_string_member(builder, "last_updated", format_timestamp(tree.last_updated));
    json_builder_set_member_name(builder, "port");
    json_builder_add_int_value(builder, tree.port);
    add_string_member(builder, "version", tree.version);
    add_styles(builder, tree.colors);
    json_builder_end_object(builder);

    JsonNode* root = json_builder_get_root(builder);
    JsonGenerator* generator = json_generator_new();
    json_generator_set_root(generator, root);
    json_generator_set_pretty(generator, pretty);
    json_generator_set_indent(generator, 2);

    gchar* data = json_generator_to_data(generator, nullptr);
    std::string result = data ? data : "";

    g_free(data);
    json_node_unref(root);
    g_object_unref(generator);
    g_object_unref(builder);
    return result;
}

std::optional<ConfigurationTree> from_json(const std::string& data, std::string& error) {
    ParserPtr parser(json_parser_new());
    GError* gerror = nullptr;
    if (!json_parser_load_from_data(parser.get(), data.c_str(), static_cast<gssize>(data.size()), &gerror)) {
        error = gerror ? gerror->message : "invalid JSON";
        if (gerror) {
            g_error_free(gerror);
        }
        return std::nullopt;
    }

    JsonNode* root = json_parser_get_root(parser.get());
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        error = "configuration root must be an object";
        return std::nullopt;
    }
    JsonObject* obj = json_node_get_object(root);

    ConfigurationTree tree;
    if (!read_timestamp(obj, "last_updated", tree.last_updated, error) ||
        !read_int(obj, "port", tree.port, error) ||
        !read_string(obj, "version", tree.version, error) ||
        !read_styles(obj, "colors", tree.colors, error)) {
        return std::nullopt;
    }
    if (tree.port == 0) {
        tree.port = kDefaultPort;
    } else if (tree.port < 0 || tree.port > 65535) {
        error = "'port' must be between 1 and 65535: " + std::to_string(tree.port);
        return std::nullopt;
    }

    if (json_object_has_member(obj, "blocks")) {
        JsonNode* blocks_node = json_object_get_member(obj, "blocks");
        if (!JSON_NODE_HOLDS_NULL(blocks_node)) {
            if (!JSON_NODE_HOLDS_ARRAY(blocks_node)) {
                error = "'blocks' must be an array";
                return std::nullopt;
            }
            JsonArray* blocks = json_node_get_array(blocks_node);
            guint length = json_array_get_length(blocks);
            for (guint i = 0; i < length; ++i) {
                Block block;
                if (!read_block(json_array_get_element(blocks, i), block, error)) {
                    error = "blocks[" + std::to_string(i) + "]: " + error;
                    return std::nullopt;
                }
                tree.blocks.push_back(std::move(block));
            }
        }
    }
    return tree;
}

bool save_to_file(const ConfigurationTree& tree, const std::string& path, std::string& error) {
    try {
        Glib::file_set_contents(path, to_json(tree, true));
    } catch (const Glib::FileError& ex) {
        error = "error writing config file " + path + ": " + ex.what();
        return false;
    }
    return true;
}

std::optional<ConfigurationTree> load_from_file(const std::string& path, std::string& error) {
    std::string data;
    try {
        data = Glib::file_get_contents(path);
    } catch (const Glib::FileError& ex) {
        error = "failed to read config file: " + std::string(ex.what());
        return std::nullopt;
    }

    auto tree = from_json(data, error);
    if (!tree) {
        error = "failed to parse config file " + path + ": " + error;
    }
    return tree;
}
}  // namespace dazibao::codec
