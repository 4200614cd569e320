#pragma once

#include "chunknet/Config.hpp"
#include "chunknet/json/Value.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace chunknet::config {

using json::Value;

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

using Path = std::vector<std::string>;

// JSON when the extension is .json or the text opens with '{' / '[', YAML subset otherwise.
Value load_document(const std::filesystem::path& path);
Value parse_document_text(const std::string& contents, bool prefer_json);
Value parse_yaml(const std::string& text);

Value merge_objects(const Value& base, const Value& overlay);
const Value* find_path(const Value& root, const Path& path);
Value resolve_profile(const Value& profiles, const std::string& profile_name);
Value collect_environment_overrides(const Value& environment_node);

std::optional<std::string> get_string(const Value& root, const Path& path);
std::optional<bool> get_bool(const Value& root, const Path& path);
std::optional<std::int64_t> get_int64(const Value& root, const Path& path);

std::optional<std::string> get_string_any(const Value& root, std::initializer_list<Path> paths);
std::optional<bool> get_bool_any(const Value& root, std::initializer_list<Path> paths);
std::optional<std::int64_t> get_int64_any(const Value& root, std::initializer_list<Path> paths);

// Resolves profile (default "default", or the environment's "profile") plus environment overrides.
Value effective_profile(const Value& document,
                        const std::optional<std::string>& profile_name,
                        const std::optional<std::string>& environment);

void apply_profile_to_config(const Value& profile, Config& config);

// Convenience: load_document + effective_profile + apply_profile_to_config.
void load_configuration(const std::filesystem::path& path,
                        const std::optional<std::string>& profile_name,
                        const std::optional<std::string>& environment,
                        Config& config);

}  // namespace chunknet::config
