#include "chunknet/config/ConfigLoader.hpp"

#include "chunknet/crypto/TokenCipher.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace chunknet::config {

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

namespace {

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

Value parse_yaml_scalar(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty() || text == "null" || text == "~") {
        return Value();
    }
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
        return Value(text.substr(1, text.size() - 2));
    }
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        Value parsed;
        try {
            parsed = json::parse(text);
        } catch (const json::ParseError& error) {
            throw ConfigError("E_CONFIG_PARSE", std::string("Invalid quoted YAML value: ") + error.what());
        }
        return parsed;
    }
    if (text == "true" || text == "True" || text == "yes") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "no") {
        return Value(false);
    }

    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
    }
    std::int64_t integer{};
    const auto result = std::from_chars(begin, end, integer);
    if (result.ec == std::errc{} && result.ptr == end) {
        return Value(integer);
    }
    const bool numeric_shape = std::all_of(begin, end, [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-' || ch == 'e' || ch == 'E';
    });
    double floating{};
    if (numeric_shape && json::parse_floating_token(begin, end, floating)) {
        return Value(floating);
    }
    return Value(text);
}

Value resolve_profile_impl(const Value& profiles, const std::string& name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    const auto* profile = profiles.find(name);
    if (!profile) {
        std::string names;
        for (const auto& [candidate, _] : profiles.as_object()) {
            names += names.empty() ? candidate : ", " + candidate;
        }
        throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + name,
                          "Available profiles: " + (names.empty() ? std::string{"<none>"} : names));
    }
    if (!profile->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + name);
    }
    if (!visiting.insert(name).second) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + name);
    }

    Value result = Value::make_object();
    Value own = *profile;
    if (const auto* parent = profile->find("extends")) {
        if (!parent->is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + name);
        }
        result = resolve_profile_impl(profiles, parent->string_value, visiting);
        own.object_value.erase("extends");
    }
    visiting.erase(name);
    return merge_objects(result, own);
}

std::string join_path(const Path& path) {
    std::string joined;
    for (const auto& segment : path) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined += segment;
    }
    return joined.empty() ? std::string{"<root>"} : joined;
}

template <typename T>
T require_range(std::int64_t value, std::int64_t min, std::int64_t max, const char* key) {
    if (value < min || value > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          std::string(key) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<T>(value);
}

}  // namespace

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Frame {
        std::size_t indent;
        Value* node;
        std::string key;
    };
    std::vector<Frame> stack;
    stack.push_back({0, &root, {}});

    std::istringstream input(text);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const std::string content_line = strip_comment(line);
        if (trim(content_line).empty()) {
            continue;
        }
        std::size_t indent = 0;
        while (indent < content_line.size() && content_line[indent] == ' ') {
            ++indent;
        }
        if (indent < content_line.size() && content_line[indent] == '\t') {
            throw ConfigError("E_CONFIG_PARSE", "Tabs are not allowed in YAML indentation (line " + std::to_string(line_number) + ")");
        }
        const std::string content = trim(content_line);

        while (stack.size() > 1 && indent < stack.back().indent) {
            stack.pop_back();
        }
        Value* current = stack.back().node;

        if (content.front() == '-') {
            // Lists hold scalars only.
            current->ensure_array().push_back(parse_yaml_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry (line " + std::to_string(line_number) + ")");
        }
        std::string key = trim(content.substr(0, colon));
        const std::string rest = trim(content.substr(colon + 1));
        if (key.size() >= 2 && (key.front() == '"' || key.front() == '\'') && key.back() == key.front()) {
            key = key.substr(1, key.size() - 2);
        }
        if (key.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Empty key in YAML mapping (line " + std::to_string(line_number) + ")");
        }

        auto& fields = current->ensure_object();
        if (rest.empty()) {
            Value& child = fields[key];
            stack.push_back({indent + 1, &child, key});
        } else {
            fields[key] = parse_yaml_scalar(rest);
        }
    }
    return root;
}

Value parse_document_text(const std::string& contents, bool prefer_json) {
    const auto first = std::find_if(contents.begin(), contents.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    const bool looks_like_json = prefer_json || (first != contents.end() && (*first == '{' || *first == '['));
    Value document;
    if (looks_like_json) {
        try {
            document = json::parse(contents);
        } catch (const json::ParseError& error) {
            throw ConfigError("E_CONFIG_PARSE", error.what());
        }
    } else {
        document = parse_yaml(contents);
    }
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    return document;
}

Value load_document(const std::filesystem::path& path) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_document_text(buffer.str(), path.extension() == ".json");
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base.is_object() ? base : Value::make_object();
    auto& fields = result.as_object();
    for (const auto& [key, value] : overlay.as_object()) {
        auto existing = fields.find(key);
        if (value.is_object() && existing != fields.end() && existing->second.is_object()) {
            existing->second = merge_objects(existing->second, value);
        } else {
            fields[key] = value;
        }
    }
    return result;
}

const Value* find_path(const Value& root, const Path& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        node = node->find(segment);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name) {
    std::set<std::string> visiting;
    return resolve_profile_impl(profiles, profile_name, visiting);
}

Value collect_environment_overrides(const Value& environment_node) {
    Value overrides = Value::make_object();
    for (const auto& [key, value] : environment_node.as_object()) {
        if (key == "profile") {
            continue;
        }
        if (key == "overrides" && value.is_object()) {
            overrides = merge_objects(overrides, value);
        } else {
            overrides.as_object()[key] = value;
        }
    }
    return overrides;
}

std::optional<std::string> get_string(const Value& root, const Path& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    if (node->is_integer()) {
        return std::to_string(node->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const Path& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const Path& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double() && std::floor(node->double_value) == node->double_value) {
        return static_cast<std::int64_t>(node->double_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::optional<std::string> get_string_any(const Value& root, std::initializer_list<Path> paths) {
    for (const auto& path : paths) {
        if (auto value = get_string(root, path)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<bool> get_bool_any(const Value& root, std::initializer_list<Path> paths) {
    for (const auto& path : paths) {
        if (auto value = get_bool(root, path)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> get_int64_any(const Value& root, std::initializer_list<Path> paths) {
    for (const auto& path : paths) {
        if (auto value = get_int64(root, path)) {
            return value;
        }
    }
    return std::nullopt;
}

Value effective_profile(const Value& document,
                        const std::optional<std::string>& profile_name,
                        const std::optional<std::string>& environment) {
    const auto* profiles = find_path(document, {"profiles"});
    if (!profiles) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration file is missing 'profiles' section",
                          "Define at least a 'default' profile under 'profiles'");
    }

    std::string selected = profile_name.value_or("default");
    Value overrides = Value::make_object();
    if (environment) {
        const auto* environments = find_path(document, {"environments"});
        if (!environments || !environments->is_object()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "Environment section not defined while --env was provided",
                              "Add an 'environments' map to the configuration file");
        }
        const auto* entry = environments->find(*environment);
        if (!entry) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "Environment not found: " + *environment);
        }
        if (!entry->is_object()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "Environment entry must be a mapping: " + *environment);
        }
        if (!profile_name) {
            if (auto env_profile = get_string(*entry, {"profile"})) {
                selected = *env_profile;
            }
        }
        overrides = collect_environment_overrides(*entry);
    }
    return merge_objects(resolve_profile(*profiles, selected), overrides);
}

void apply_profile_to_config(const Value& profile, Config& config) {
    if (!profile.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile configuration must be a mapping");
    }
    constexpr std::int64_t kPortMax = std::numeric_limits<std::uint16_t>::max();
    constexpr std::int64_t kDayInSeconds = 24 * 60 * 60;

    if (auto host = get_string(profile, {"coordinator", "host"})) {
        config.coordinator_host = *host;
    }
    if (auto port = get_int64(profile, {"coordinator", "port"})) {
        config.coordinator_port = require_range<std::uint16_t>(*port, 1, kPortMax, "coordinator.port");
    }
    if (auto size = get_int64_any(profile, {{"coordinator", "chunk_size"}, {"coordinator", "chunk_size_bytes"}})) {
        config.chunk_size_bytes = require_range<std::size_t>(*size, 1, std::int64_t{1} << 30, "coordinator.chunk_size");
    }
    if (auto redundancy = get_int64_any(profile, {{"coordinator", "redundancy"}, {"coordinator", "chunk_redundancy"}})) {
        config.chunk_redundancy = require_range<std::uint16_t>(*redundancy, 1, 64, "coordinator.redundancy");
    }
    if (auto timeout = get_int64(profile, {"coordinator", "heartbeat_timeout"})) {
        config.heartbeat_timeout = std::chrono::seconds(
            require_range<std::int64_t>(*timeout, 1, kDayInSeconds, "coordinator.heartbeat_timeout"));
    }
    if (auto interval = get_int64(profile, {"coordinator", "heal_interval"})) {
        config.heal_idle_interval = std::chrono::seconds(
            require_range<std::int64_t>(*interval, 1, kDayInSeconds, "coordinator.heal_interval"));
    }
    if (auto size = get_int64(profile, {"coordinator", "manifest_chunk_size"})) {
        config.manifest_chunk_size = require_range<std::size_t>(*size, 64, std::int64_t{1} << 24, "coordinator.manifest_chunk_size");
    }
    if (auto key = get_string(profile, {"coordinator", "manifest_key"})) {
        if (!crypto::TokenCipher::decode_key(*key)) {
            throw ConfigError("E_CONFIG_VALUE", "coordinator.manifest_key is not a valid key",
                              "Generate one with 'chunknet keygen'");
        }
        config.manifest_key = *key;
    }
    if (auto seed = get_int64(profile, {"coordinator", "placement_seed"})) {
        config.placement_seed = require_range<std::uint32_t>(*seed, 0, std::numeric_limits<std::uint32_t>::max(),
                                                             "coordinator.placement_seed");
    }

    if (auto work_dir = get_string_any(profile, {{"storage", "work_dir"}, {"storage", "directory"}})) {
        config.work_directory = *work_dir;
    }

    if (auto id = get_string(profile, {"node", "id"})) {
        if (!is_valid_identifier(*id)) {
            throw ConfigError("E_CONFIG_VALUE", "node.id may only contain letters, digits, '_', '-' and '.'");
        }
        config.node_id = *id;
    }
    if (auto host = get_string(profile, {"node", "host"})) {
        config.node_host = *host;
    }
    if (auto port = get_int64(profile, {"node", "port"})) {
        config.node_port = require_range<std::uint16_t>(*port, 1, kPortMax, "node.port");
    }
    if (auto dir = get_string_any(profile, {{"node", "chunk_dir"}, {"node", "chunk_folder"}})) {
        config.chunk_directory = *dir;
    }
    if (auto available = get_int64(profile, {"node", "storage_available"})) {
        config.storage_available = require_range<std::uint64_t>(*available, 0, std::numeric_limits<std::int64_t>::max(),
                                                                "node.storage_available");
    }
    if (auto interval = get_int64(profile, {"node", "heartbeat_interval"})) {
        config.heartbeat_interval = std::chrono::seconds(
            require_range<std::int64_t>(*interval, 1, kDayInSeconds, "node.heartbeat_interval"));
    }
    if (auto wipe = get_bool(profile, {"node", "wipe_on_delete"})) {
        config.wipe_on_delete = *wipe;
    }

    if (auto timeout = get_int64(profile, {"http", "timeout"})) {
        config.http_timeout = std::chrono::seconds(require_range<std::int64_t>(*timeout, 1, kDayInSeconds, "http.timeout"));
    }
    if (auto timeout = get_int64(profile, {"http", "connect_timeout"})) {
        config.http_connect_timeout = std::chrono::seconds(
            require_range<std::int64_t>(*timeout, 1, kDayInSeconds, "http.connect_timeout"));
    }
    if (auto timeout = get_int64(profile, {"http", "transfer_timeout"})) {
        config.http_transfer_timeout = std::chrono::seconds(
            require_range<std::int64_t>(*timeout, 0, kDayInSeconds, "http.transfer_timeout"));
    }
    if (auto limit = get_int64(profile, {"http", "max_request_bytes"})) {
        config.max_request_bytes = require_range<std::size_t>(*limit, 1024, std::int64_t{1} << 34, "http.max_request_bytes");
    }

    if (auto level = get_string(profile, {"logging", "level"})) {
        if (!daemon::StructuredLogger::parse_level(*level)) {
            throw ConfigError("E_CONFIG_VALUE", "logging.level must be one of debug, info, warning, error");
        }
        config.log_level = *level;
    }
}

void load_configuration(const std::filesystem::path& path,
                        const std::optional<std::string>& profile_name,
                        const std::optional<std::string>& environment,
                        Config& config) {
    const Value document = load_document(path);
    apply_profile_to_config(effective_profile(document, profile_name, environment), config);
}

}  // namespace chunknet::config
