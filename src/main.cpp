#include "chunknet/Config.hpp"
#include "chunknet/Types.hpp"
#include "chunknet/config/ConfigLoader.hpp"
#include "chunknet/coordinator/Coordinator.hpp"
#include "chunknet/crypto/TokenCipher.hpp"
#include "chunknet/daemon/CoordinatorApi.hpp"
#include "chunknet/daemon/NodeApi.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/json/Value.hpp"
#include "chunknet/net/HttpClient.hpp"
#include "chunknet/net/NodeTransport.hpp"
#include "chunknet/net/Url.hpp"
#include "chunknet/node/HeartbeatClient.hpp"
#include "chunknet/storage/ChunkSplitter.hpp"
#include "chunknet/storage/ChunkStore.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <signal.h>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#ifndef CHUNKNET_VERSION
#define CHUNKNET_VERSION "v0.1.0"
#endif

namespace {

using namespace std::chrono_literals;
using chunknet::daemon::StructuredLogger;
using chunknet::json::Value;

constexpr std::string_view kChunknetVersion = CHUNKNET_VERSION;

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> profile_name;
    std::optional<std::string> environment;
    std::optional<std::string> log_level;
    bool quiet{false};
    std::optional<std::string> coordinator_url;
    std::optional<std::string> work_dir;
    std::optional<std::string> node_id;
    std::optional<std::string> node_host;
    std::optional<std::uint16_t> node_port;
    std::optional<std::string> chunk_dir;
    std::optional<std::uint64_t> storage_available;
    std::optional<std::uint16_t> redundancy;
    std::optional<std::size_t> chunk_size;
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

[[noreturn]] void throw_coordinator_unreachable(const std::string& url, const std::string& detail) {
    throw_cli_error("E_COORDINATOR_UNREACHABLE",
                    "Could not contact the coordinator at " + url + " (" + detail + ")",
                    "Start it with 'chunknet coordinator' and verify --coordinator");
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool is_help_flag(std::string_view arg) {
    return arg == "--help" || arg == "-h";
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_uint16(std::string_view text, std::uint16_t& value) {
    std::uint64_t temp{};
    if (!parse_uint64(text, temp) || temp > std::numeric_limits<std::uint16_t>::max()) {
        return false;
    }
    value = static_cast<std::uint16_t>(temp);
    return true;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit_index;
    }
    char buffer[32];
    if (unit_index == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, kUnits[unit_index]);
    }
    return buffer;
}

// Accepts "host:port", "host" or a full http:// URL; returns the URL without a trailing slash.
std::string normalize_coordinator_url(std::string value) {
    if (value.empty()) {
        throw_cli_error("E_INVALID_COORDINATOR",
                        "--coordinator must not be empty",
                        "Use host:port, e.g. --coordinator 127.0.0.1:8000");
    }
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
        return value;
    }
    const auto colon = value.rfind(':');
    if (colon == std::string::npos) {
        return "http://" + value + ":8000";
    }
    std::uint16_t port{};
    if (colon == 0 || !parse_uint16(std::string_view(value).substr(colon + 1), port) || port == 0) {
        throw_cli_error("E_INVALID_COORDINATOR",
                        "Invalid coordinator endpoint: " + value,
                        "Use host:port with a port between 1 and 65535");
    }
    return "http://" + value;
}

enum class ShutdownReason {
    None,
    Signal
};

std::atomic<bool> g_run_loop{false};
std::atomic<ShutdownReason> g_shutdown_reason{ShutdownReason::None};

void request_shutdown(ShutdownReason reason) noexcept {
    g_shutdown_reason.store(reason, std::memory_order_release);
    g_run_loop.store(false, std::memory_order_release);
}

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
        request_shutdown(ShutdownReason::Signal);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGQUIT
    std::signal(SIGQUIT, SIG_DFL);
#endif
}

void wait_for_shutdown() {
    while (g_run_loop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(200ms);
    }
    if (g_shutdown_reason.exchange(ShutdownReason::None, std::memory_order_acq_rel) == ShutdownReason::Signal) {
        std::cout << "\nInterrupt received, shutting down..." << std::endl;
    }
}

void print_usage() {
    std::cout << "ChunkNet CLI" << std::endl;
    std::cout << "Usage: chunknet [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           Load configuration from YAML/JSON file\n"
              << "  --profile <name>          Select configuration profile (default: default)\n"
              << "  --env <name>              Apply environment overrides from config\n"
              << "  --log-level <level>       debug, info, warning or error (default: info)\n"
              << "  --quiet                   Disable structured logging\n"
              << "  --coordinator <endpoint>  Coordinator host:port or URL (default 127.0.0.1:8000)\n"
              << "  --work-dir <path>         Coordinator work directory (default ./work_dir)\n"
              << "  --node-id <id>            Storage node identifier (default: random node-xxxxxx)\n"
              << "  --node-host <host>        Address the node binds and advertises (default 127.0.0.1)\n"
              << "  --node-port <port>        Storage node HTTP port (default 5001, 0 = ephemeral)\n"
              << "  --chunk-dir <path>        Storage node chunk folder (default ./chunks)\n"
              << "  --storage-available <n>   Storage capacity reported on registration\n"
              << "  --redundancy <n>          Copies kept of every chunk (default 3)\n"
              << "  --chunk-size <bytes>      Upload chunk size (default 102400)\n"
              << "  --version                 Print the CLI version and exit\n"
              << "  --help                    Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  coordinator               Run the coordinator service until interrupted\n"
              << "  node                      Run a storage node until interrupted\n"
              << "  upload <file>             Upload a file through the coordinator\n"
              << "  download <file_id> [--out <path>]\n"
              << "                            Download and reassemble a stored file\n"
              << "  manifest <file_id>        Print a file manifest\n"
              << "  status                    Print network status\n"
              << "  nodes                     List registered storage nodes\n"
              << "  locate <chunk_id>         Show which nodes hold a chunk\n"
              << "  assign <chunk_id> <node_id>\n"
              << "                            Record a manual chunk assignment\n"
              << "  keys                      Print the number of stored manifests\n"
              << "  heal                      Queue every under-replicated chunk for healing\n"
              << "  split <file> [--out-dir <dir>]\n"
              << "                            Split a file locally into chunk_NNNNN pieces\n"
              << "  reassemble <dir> <out>    Join chunk_NNNNN pieces back into a file\n"
              << "  keygen                    Print a fresh manifest key for coordinator.manifest_key\n"
              << "  help                      Print this help message\n";
}

chunknet::Config build_config(const GlobalOptions& options) {
    chunknet::Config config{};
    if (options.config_path) {
        try {
            chunknet::config::load_configuration(*options.config_path,
                                                 options.profile_name,
                                                 options.environment,
                                                 config);
        } catch (const chunknet::config::ConfigError& ex) {
            throw_cli_error(ex.code, ex.message, ex.hint);
        }
    } else if (options.profile_name || options.environment) {
        throw_cli_error("E_CONFIG_REQUIRED",
                        "--profile and --env require --config",
                        "Pass the configuration file with --config <file>");
    }

    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    if (options.coordinator_url) {
        const auto url = normalize_coordinator_url(*options.coordinator_url);
        const auto scheme_end = url.find("://");
        const auto host_port = url.substr(scheme_end + 3);
        const auto colon = host_port.rfind(':');
        if (colon != std::string::npos) {
            std::uint16_t port{};
            if (parse_uint16(std::string_view(host_port).substr(colon + 1), port)) {
                config.coordinator_host = host_port.substr(0, colon);
                config.coordinator_port = port;
            }
        }
    }
    if (options.work_dir) {
        config.work_directory = *options.work_dir;
    }
    if (options.node_id) {
        config.node_id = *options.node_id;
    }
    if (options.node_host) {
        config.node_host = *options.node_host;
    }
    if (options.node_port) {
        config.node_port = *options.node_port;
    }
    if (options.chunk_dir) {
        config.chunk_directory = *options.chunk_dir;
    }
    if (options.storage_available) {
        config.storage_available = *options.storage_available;
    }
    if (options.redundancy) {
        config.chunk_redundancy = *options.redundancy;
    }
    if (options.chunk_size) {
        config.chunk_size_bytes = *options.chunk_size;
    }
    return config;
}

void configure_logging(const GlobalOptions& options, const chunknet::Config& config) {
    auto& logger = StructuredLogger::instance();
    const auto level = StructuredLogger::parse_level(config.log_level);
    if (!level) {
        throw_cli_error("E_INVALID_LOG_LEVEL",
                        "Unknown log level: " + config.log_level,
                        "Use one of debug, info, warning, error");
    }
    logger.set_min_level(*level);
    logger.set_enabled(!options.quiet);
}

void require_no_more_args(const std::vector<std::string_view>& args, std::size_t index, std::string_view command) {
    if (index < args.size()) {
        throw_cli_error("E_UNEXPECTED_ARGUMENT",
                        std::string(command) + " does not accept argument " + std::string(args[index]),
                        "Run 'chunknet --help' for usage");
    }
}

std::string require_positional(const std::vector<std::string_view>& args,
                               std::size_t& index,
                               std::string_view command,
                               std::string_view what) {
    if (index >= args.size() || args[index].starts_with("-")) {
        throw_cli_error("E_MISSING_ARGUMENT",
                        std::string(command) + " requires " + std::string(what),
                        "Run 'chunknet --help' for usage");
    }
    return std::string(args[index++]);
}

Value expect_json(const chunknet::net::HttpResult& result, const std::string& url, std::string_view what) {
    if (!result.transport_ok()) {
        throw_coordinator_unreachable(url, result.error);
    }
    if (!result.ok()) {
        throw_cli_error("E_REQUEST_FAILED",
                        std::string(what) + " failed with HTTP " + std::to_string(result.status) + ": " +
                            result.error_message());
    }
    auto body = result.json_body();
    if (!body) {
        throw_cli_error("E_BAD_RESPONSE",
                        std::string(what) + " returned a body that is not JSON",
                        "Check that --coordinator points at a chunknet coordinator");
    }
    return std::move(*body);
}

chunknet::ChunkData read_file_bytes(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw_cli_error("E_FILE_NOT_FOUND", "File not found: " + path.string());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw_cli_error("E_FILE_READ", "Unable to open " + path.string());
    }
    return chunknet::ChunkData(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file_bytes(const std::filesystem::path& path, const chunknet::ChunkData& data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw_cli_error("E_FILE_WRITE", "Unable to create " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw_cli_error("E_FILE_WRITE", "Failed to write " + path.string());
    }
}

int run_coordinator(const chunknet::Config& config) {
    chunknet::net::HttpNodeTransport transport(
        chunknet::net::HttpClient(config.http_timeout, config.http_connect_timeout));
    chunknet::coordinator::Coordinator coordinator(config, transport);
    chunknet::daemon::CoordinatorApi api(coordinator, config);

    g_shutdown_reason.store(ShutdownReason::None, std::memory_order_release);
    g_run_loop.store(true, std::memory_order_release);
    api.start(config.coordinator_host, config.coordinator_port);
    coordinator.start();
    install_termination_handlers();

    std::cout << "Coordinator listening on " << config.coordinator_host << ':' << api.port() << std::endl;
    std::cout << "Work directory: " << config.work_directory << std::endl;
    std::cout << "Redundancy: " << config.chunk_redundancy << ", chunk size: "
              << format_bytes(config.chunk_size_bytes) << std::endl;
    std::cout << "Press Ctrl+C to exit." << std::endl;

    wait_for_shutdown();

    std::cout << "Stopping healer..." << std::endl;
    coordinator.stop();
    std::cout << "Stopping HTTP server..." << std::endl;
    api.stop();
    uninstall_termination_handlers();
    std::cout << "Coordinator stopped." << std::endl;
    return 0;
}

// A wildcard bind address is not reachable from other hosts; let the coordinator use our source address.
std::string advertised_host(const std::string& bind_host) {
    if (bind_host.empty() || bind_host == "0.0.0.0" || bind_host == "::") {
        return {};
    }
    return bind_host;
}

int run_node(const chunknet::Config& config) {
    const auto node_id = config.node_id.value_or(chunknet::generate_node_id());
    if (!chunknet::is_valid_identifier(node_id)) {
        throw_cli_error("E_INVALID_NODE_ID",
                        "Invalid node id: " + node_id,
                        "Use letters, digits, '-', '_' or '.'");
    }

    chunknet::storage::ChunkStore store(config.chunk_directory, config.wipe_on_delete);
    chunknet::daemon::NodeApi api(node_id, store, config);

    g_shutdown_reason.store(ShutdownReason::None, std::memory_order_release);
    g_run_loop.store(true, std::memory_order_release);
    api.start(config.node_host, config.node_port);
    install_termination_handlers();

    chunknet::node::NodeRegistration registration{
        node_id, config.storage_available, advertised_host(config.node_host), api.port()};
    chunknet::node::HeartbeatClient heartbeat(config.coordinator_url(),
                                              registration,
                                              config.heartbeat_interval,
                                              chunknet::net::HttpClient(config.http_timeout,
                                                                        config.http_connect_timeout));
    if (!heartbeat.register_node()) {
        std::cout << "Coordinator at " << config.coordinator_url()
                  << " did not accept registration yet; retrying with heartbeats." << std::endl;
    }
    heartbeat.start();

    std::cout << "Node " << node_id << " listening on " << config.node_host << ':' << api.port() << std::endl;
    std::cout << "Chunk folder: " << store.root().string() << " (" << store.size() << " chunks)" << std::endl;
    std::cout << "Coordinator: " << config.coordinator_url() << std::endl;
    std::cout << "Press Ctrl+C to exit." << std::endl;

    wait_for_shutdown();

    heartbeat.stop();
    api.stop();
    uninstall_termination_handlers();
    std::cout << "Node stopped." << std::endl;
    return 0;
}

void print_status(const Value& status) {
    std::cout << "Nodes online:  " << status.get_int64("node_count").value_or(0) << std::endl;
    if (const auto* nodes = status.find("registered_nodes"); nodes && nodes->is_array()) {
        for (const auto& node : nodes->as_array()) {
            if (node.is_string()) {
                std::cout << "  - " << node.string_value << std::endl;
            }
        }
    }
    std::cout << "Files stored:  " << status.get_int64("file_count").value_or(0) << std::endl;
    if (const auto* files = status.find("files"); files && files->is_object()) {
        for (const auto& [file_id, info] : files->as_object()) {
            std::cout << "  - " << file_id << "  " << info.get_string("original_filename").value_or("?")
                      << "  (" << info.get_int64("chunk_count").value_or(0) << " chunks)" << std::endl;
        }
    }
    std::cout << "Total chunks:  " << status.get_int64("total_chunks").value_or(0) << std::endl;
    std::cout << "Healing queue: " << status.get_int64("healing_queue").value_or(0) << std::endl;
    if (const auto* errors = status.find("manifest_errors"); errors && errors->is_array() && !errors->as_array().empty()) {
        std::cout << "Manifest errors:" << std::endl;
        for (const auto& entry : errors->as_array()) {
            std::cout << "  - " << entry.get_string("file_id").value_or("?") << ": "
                      << entry.get_string("error").value_or("") << std::endl;
        }
    }
}

void print_nodes(const Value& nodes) {
    if (!nodes.is_object() || nodes.as_object().empty()) {
        std::cout << "No nodes registered." << std::endl;
        return;
    }
    for (const auto& [node_id, info] : nodes.as_object()) {
        std::cout << node_id << "  " << info.get_string("ip").value_or("?") << ':'
                  << info.get_int64("port").value_or(0) << "  storage="
                  << info.get_int64("storage_available").value_or(0);
        if (const auto* seen = info.find("last_seen"); seen && seen->is_number()) {
            std::cout << "  last_seen=" << (seen->is_integer() ? static_cast<double>(seen->integer_value)
                                                               : seen->double_value);
        }
        std::cout << std::endl;
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        auto require_port = [&](std::string_view option) -> std::uint16_t {
            const auto value = require_value(option);
            std::uint16_t port{};
            if (!parse_uint16(value, port)) {
                throw_cli_error("E_INVALID_PORT",
                                std::string(option) + " must be between 0 and 65535",
                                "For example: " + std::string(option) + " 5001");
            }
            return port;
        };

        std::optional<std::string> extracted_command;

        while (index < args.size()) {
            if (!args[index].starts_with("-")) {
                if (!extracted_command) {
                    extracted_command = std::string(args[index++]);
                    continue;
                }
                break;
            }

            const auto opt = args[index++];
            if (is_help_flag(opt)) {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "ChunkNet " << kChunknetVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--profile") {
                if (options.profile_name.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --profile specified multiple times",
                                    "Select a single profile");
                }
                options.profile_name = require_value(opt);
                continue;
            }
            if (opt == "--env") {
                if (options.environment.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --env specified multiple times",
                                    "Select a single environment override");
                }
                options.environment = require_value(opt);
                continue;
            }
            if (opt == "--log-level") {
                options.log_level = to_lower(require_value(opt));
                continue;
            }
            if (opt == "--quiet" || opt == "-q") {
                options.quiet = true;
                continue;
            }
            if (opt == "--coordinator") {
                options.coordinator_url = require_value(opt);
                continue;
            }
            if (opt == "--work-dir") {
                options.work_dir = require_value(opt);
                continue;
            }
            if (opt == "--node-id") {
                options.node_id = require_value(opt);
                continue;
            }
            if (opt == "--node-host") {
                options.node_host = require_value(opt);
                continue;
            }
            if (opt == "--node-port") {
                options.node_port = require_port(opt);
                continue;
            }
            if (opt == "--chunk-dir") {
                options.chunk_dir = require_value(opt);
                continue;
            }
            if (opt == "--storage-available") {
                const auto value = require_value(opt);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed)) {
                    throw_cli_error("E_INVALID_STORAGE",
                                    "--storage-available must be an unsigned integer",
                                    "For example: --storage-available 1024");
                }
                options.storage_available = parsed;
                continue;
            }
            if (opt == "--redundancy") {
                const auto value = require_value(opt);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0 || parsed > 64) {
                    throw_cli_error("E_INVALID_REDUNDANCY",
                                    "--redundancy must be between 1 and 64",
                                    "For example: --redundancy 3");
                }
                options.redundancy = static_cast<std::uint16_t>(parsed);
                continue;
            }
            if (opt == "--chunk-size") {
                const auto value = require_value(opt);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0) {
                    throw_cli_error("E_INVALID_CHUNK_SIZE",
                                    "--chunk-size must be a positive number of bytes",
                                    "For example: --chunk-size 102400");
                }
                options.chunk_size = static_cast<std::size_t>(parsed);
                continue;
            }
            if (extracted_command) {
                // Command-specific option; hand it to the command parser below.
                --index;
                break;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'chunknet --help' to view available options");
        }

        std::string command;
        if (extracted_command) {
            command = to_lower(*extracted_command);
        } else {
            print_usage();
            return 1;
        }
        if (command == "help") {
            print_usage();
            return 0;
        }

        const auto config = build_config(options);
        configure_logging(options, config);

        if (command == "keygen") {
            require_no_more_args(args, index, command);
            const auto key = chunknet::crypto::TokenCipher::generate_key();
            std::cout << chunknet::crypto::TokenCipher::encode_key(key) << std::endl;
            return 0;
        }

        if (command == "split") {
            const auto input = require_positional(args, index, command, "a file path");
            std::filesystem::path out_dir = std::filesystem::path(input).filename().string() + ".chunks";
            while (index < args.size()) {
                const auto arg = args[index++];
                if (arg == "--out-dir") {
                    out_dir = require_value(arg);
                    continue;
                }
                throw_cli_error("E_SPLIT_UNKNOWN_OPTION",
                                "Unknown option for split: " + std::string(arg),
                                "Usage: chunknet split <file> [--out-dir <dir>]");
            }
            try {
                const auto pieces = chunknet::storage::split_file(input, config.chunk_size_bytes, out_dir);
                std::cout << "Split " << input << " into " << pieces.size() << " chunks in "
                          << out_dir.string() << std::endl;
            } catch (const std::exception& ex) {
                throw_cli_error("E_SPLIT_FAILED", ex.what());
            }
            return 0;
        }

        if (command == "reassemble") {
            const auto folder = require_positional(args, index, command, "a chunk folder");
            const auto output = require_positional(args, index, command, "an output path");
            require_no_more_args(args, index, command);
            std::error_code ec;
            if (!std::filesystem::is_directory(folder, ec)) {
                throw_cli_error("E_FILE_NOT_FOUND", "Chunk folder not found: " + folder);
            }
            try {
                const auto bytes = chunknet::storage::reassemble_file(output, folder);
                std::cout << "Reassembled " << format_bytes(bytes) << " into " << output << std::endl;
            } catch (const std::exception& ex) {
                throw_cli_error("E_REASSEMBLE_FAILED", ex.what());
            }
            return 0;
        }

        if (command == "coordinator") {
            require_no_more_args(args, index, command);
            return run_coordinator(config);
        }

        if (command == "node") {
            require_no_more_args(args, index, command);
            return run_node(config);
        }

        const auto base_url = options.coordinator_url ? normalize_coordinator_url(*options.coordinator_url)
                                                      : config.coordinator_url();
        const chunknet::net::HttpClient client(config.http_timeout, config.http_connect_timeout);
        // The coordinator answers an upload only after every chunk reached its nodes.
        const chunknet::net::HttpClient transfer_client(config.http_transfer_timeout, config.http_connect_timeout);

        if (command == "upload") {
            const auto input = require_positional(args, index, command, "a file path");
            require_no_more_args(args, index, command);
            const auto data = read_file_bytes(input);
            const auto filename = std::filesystem::path(input).filename().string();
            const auto url = base_url + "/upload_file?filename=" + chunknet::net::url_encode(filename);
            const auto body = expect_json(transfer_client.post(url, data), base_url, "Upload");
            std::cout << "Uploaded " << filename << " (" << format_bytes(data.size()) << ")" << std::endl;
            std::cout << "File ID: " << body.get_string("file_id").value_or("?") << std::endl;
            std::cout << "Chunks stored: " << body.get_int64("chunks_stored").value_or(0) << '/'
                      << body.get_int64("chunks_total").value_or(0) << std::endl;
            return 0;
        }

        if (command == "download") {
            const auto file_id = require_positional(args, index, command, "a file id");
            std::optional<std::filesystem::path> out_path;
            while (index < args.size()) {
                const auto arg = args[index++];
                if (arg == "--out" || arg == "-o") {
                    out_path = require_value(arg);
                    continue;
                }
                throw_cli_error("E_DOWNLOAD_UNKNOWN_OPTION",
                                "Unknown option for download: " + std::string(arg),
                                "Usage: chunknet download <file_id> [--out <path>]");
            }
            const auto encoded_id = chunknet::net::url_encode(file_id);
            if (!out_path) {
                const auto manifest = expect_json(client.get(base_url + "/manifest/" + encoded_id), base_url, "Manifest lookup");
                const auto original = manifest.get_string("original_filename").value_or(file_id);
                out_path = std::filesystem::path(original).filename();
                if (out_path->empty()) {
                    out_path = file_id;
                }
            }
            const auto result = transfer_client.get(base_url + "/download_file/" + encoded_id);
            if (!result.transport_ok()) {
                throw_coordinator_unreachable(base_url, result.error);
            }
            if (!result.ok()) {
                throw_cli_error("E_DOWNLOAD_FAILED",
                                "Download failed with HTTP " + std::to_string(result.status) + ": " +
                                    result.error_message(),
                                result.status == 502 ? "Some chunks have no live holder; try 'chunknet heal' and retry"
                                                     : std::string{});
            }
            write_file_bytes(*out_path, result.body);
            std::cout << "Downloaded " << format_bytes(result.body.size()) << " to " << out_path->string() << std::endl;
            return 0;
        }

        if (command == "manifest") {
            const auto file_id = require_positional(args, index, command, "a file id");
            require_no_more_args(args, index, command);
            const auto body = expect_json(client.get(base_url + "/manifest/" + chunknet::net::url_encode(file_id)),
                                          base_url,
                                          "Manifest lookup");
            std::cout << chunknet::json::serialize(body) << std::endl;
            return 0;
        }

        if (command == "status") {
            require_no_more_args(args, index, command);
            print_status(expect_json(client.get(base_url + "/status"), base_url, "Status"));
            return 0;
        }

        if (command == "nodes") {
            require_no_more_args(args, index, command);
            print_nodes(expect_json(client.get(base_url + "/nodes"), base_url, "Node listing"));
            return 0;
        }

        if (command == "locate") {
            const auto chunk_id = require_positional(args, index, command, "a chunk id");
            require_no_more_args(args, index, command);
            const auto body = expect_json(client.get(base_url + "/chunk/" + chunknet::net::url_encode(chunk_id)),
                                          base_url,
                                          "Chunk lookup");
            const auto* nodes = body.find("nodes");
            if (!nodes || !nodes->is_array() || nodes->as_array().empty()) {
                std::cout << chunk_id << " has no holders." << std::endl;
                return 0;
            }
            for (const auto& node : nodes->as_array()) {
                if (node.is_string()) {
                    std::cout << node.string_value << std::endl;
                }
            }
            return 0;
        }

        if (command == "assign") {
            const auto chunk_id = require_positional(args, index, command, "a chunk id");
            const auto node_id = require_positional(args, index, command, "a node id");
            require_no_more_args(args, index, command);
            auto request = Value::make_object();
            request.set("chunk_id", Value(chunk_id));
            request.set("node_id", Value(node_id));
            const auto body = expect_json(client.post_json(base_url + "/chunk", request), base_url, "Assignment");
            std::cout << body.get_string("status").value_or("chunk assigned") << std::endl;
            return 0;
        }

        if (command == "keys") {
            require_no_more_args(args, index, command);
            const auto body = expect_json(client.get(base_url + "/keys"), base_url, "Key count");
            std::cout << "Stored manifests: " << body.get_int64("stored_keys").value_or(0) << std::endl;
            return 0;
        }

        if (command == "heal") {
            require_no_more_args(args, index, command);
            const chunknet::ChunkData empty;
            const auto body = expect_json(client.post(base_url + "/heal_now", empty, "application/json"),
                                          base_url,
                                          "Heal request");
            std::cout << body.get_string("status").value_or("Healing started") << " ("
                      << body.get_int64("queued").value_or(0) << " chunks queued)" << std::endl;
            return 0;
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + command,
                        "Run 'chunknet --help' to see the list of available commands");

    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const chunknet::config::ConfigError& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint.empty()) {
            std::cerr << "Hint: " << ex.hint << std::endl;
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
