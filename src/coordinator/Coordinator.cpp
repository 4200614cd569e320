#include "chunknet/coordinator/Coordinator.hpp"

#include "chunknet/crypto/TokenCipher.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/storage/ChunkSplitter.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace chunknet::coordinator {

namespace {

using daemon::StructuredLogger;

crypto::Key resolve_master_key(const Config& config) {
    if (config.manifest_key) {
        if (auto key = crypto::TokenCipher::decode_key(*config.manifest_key)) {
            return *key;
        }
        throw std::invalid_argument("manifest key is not a valid encoded key");
    }
    log_event(StructuredLogger::Level::Warning, "coordinator.manifest_key.generated",
              {{"detail", "manifests written by earlier runs will not be readable"}});
    return crypto::TokenCipher::generate_key();
}

double to_epoch_seconds(Clock::time_point point) {
    return std::chrono::duration<double>(point.time_since_epoch()).count();
}

std::int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()).count();
}

ChunkData read_file_bytes(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    return ChunkData((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

// Best-effort removal of scratch files; failures are logged, never fatal.
void remove_scratch(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        log_event(StructuredLogger::Level::Warning, "coordinator.cleanup.failed",
                  {{"path", path.string()}, {"error", ec.message()}});
    }
}

json::Value string_array(const std::vector<std::string>& values) {
    json::Value array = json::Value::make_array();
    for (const auto& value : values) {
        array.push_back(json::Value(value));
    }
    return array;
}

}  // namespace

ApiResult ApiResult::ok(json::Value body) {
    return ApiResult{200, std::move(body)};
}

ApiResult ApiResult::error(int status, std::string_view code, std::string_view message) {
    json::Value body = json::Value::make_object();
    body.set("error", json::Value(std::string(message)));
    body.set("code", json::Value(std::string(code)));
    return ApiResult{status, std::move(body)};
}

std::string_view heal_outcome_to_string(HealOutcome outcome) {
    switch (outcome) {
    case HealOutcome::Healed:
        return "healed";
    case HealOutcome::Partial:
        return "partial";
    case HealOutcome::AlreadyHealthy:
        return "already_healthy";
    case HealOutcome::Unhealable:
        return "unhealable";
    case HealOutcome::NoLiveDonor:
        return "no_live_donor";
    case HealOutcome::UnknownChunk:
        return "unknown_chunk";
    }
    return "unknown";
}

Coordinator::Coordinator(Config config, net::NodeTransport& transport)
    : config_(std::move(config)),
      transport_(transport),
      planner_(config_.placement_seed) {
    if (config_.chunk_redundancy == 0) {
        throw std::invalid_argument("chunk redundancy must be at least 1");
    }
    if (config_.chunk_size_bytes == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    manifests_ = std::make_unique<manifest::ManifestStore>(config_.manifest_directory(),
                                                           config_.manifest_chunk_size,
                                                           resolve_master_key(config_));
    std::filesystem::create_directories(config_.temp_chunk_directory());
    std::filesystem::create_directories(config_.temp_upload_directory());
}

Coordinator::~Coordinator() {
    stop();
}

ApiResult Coordinator::register_node(const NodeId& node_id,
                                     std::uint64_t storage_available,
                                     const std::string& host,
                                     std::uint16_t port) {
    if (!is_valid_identifier(node_id)) {
        return ApiResult::error(400, "ERR_INVALID_NODE_ID", "node_id may only contain letters, digits, '_', '-' and '.'");
    }
    if (port == 0 || host.empty()) {
        return ApiResult::error(400, "ERR_INVALID_ENDPOINT", "Node host and port are required");
    }
    NodeInfo info;
    info.node_id = node_id;
    info.storage_available = storage_available;
    info.host = host;
    info.port = port;
    registry_.register_node(std::move(info));

    log_event(StructuredLogger::Level::Info, "coordinator.node.registered",
              {{"node_id", node_id}, {"host", host}, {"port", std::to_string(port)}});

    json::Value body = json::Value::make_object();
    body.set("status", json::Value("registered"));
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::heartbeat(const NodeId& node_id) {
    if (!registry_.heartbeat(node_id)) {
        log_event(StructuredLogger::Level::Warning, "coordinator.heartbeat.unknown_node", {{"node_id", node_id}});
        return ApiResult::error(404, "ERR_NODE_NOT_REGISTERED",
                                "Ghost node " + node_id + " tried to heartbeat. Not registered.");
    }
    sweep_expired();

    json::Value body = json::Value::make_object();
    body.set("status", json::Value("alive"));
    return ApiResult::ok(std::move(body));
}

std::vector<NodeId> Coordinator::sweep_expired(Clock::time_point now) {
    auto expired = registry_.expire(now, config_.heartbeat_timeout);
    for (const auto& node_id : expired) {
        // The node is already out of the registry; one failure must not strand the others.
        try {
            mark_node_dead(node_id);
        } catch (const std::exception& error) {
            log_event(StructuredLogger::Level::Error, "coordinator.node.dead_cleanup_failed",
                      {{"node_id", node_id}, {"error", error.what()}});
        }
    }
    return expired;
}

std::size_t Coordinator::mark_node_dead(const NodeId& node_id) {
    log_event(StructuredLogger::Level::Warning, "coordinator.node.dead", {{"node_id", node_id}});
    registry_.remove(node_id);

    std::size_t queued = 0;
    std::scoped_lock lock(manifest_update_mutex_);
    for (const auto& file_id : manifests_->list()) {
        manifest::FileManifest manifest;
        try {
            manifest = manifests_->load(file_id);
        } catch (const manifest::ManifestNotFound&) {
            log_event(StructuredLogger::Level::Debug, "coordinator.manifest.vanished", {{"file_id", file_id}});
            continue;
        } catch (const manifest::ManifestCorrupt& error) {
            log_event(StructuredLogger::Level::Error, "coordinator.manifest.unreadable",
                      {{"file_id", file_id}, {"error", error.what()}});
            continue;
        }

        const auto affected = manifest.remove_node(node_id);
        if (affected.empty()) {
            continue;
        }
        for (const auto& chunk_id : affected) {
            if (const auto* chunk = manifest.find_chunk(chunk_id)) {
                queued += queue_if_degraded(*chunk);
            }
        }
        try {
            manifests_->update(file_id, manifest);
        } catch (const std::runtime_error& error) {
            log_event(StructuredLogger::Level::Error, "coordinator.manifest.update_failed",
                      {{"file_id", file_id}, {"node_id", node_id}, {"error", error.what()}});
            continue;
        }
        log_event(StructuredLogger::Level::Info, "coordinator.manifest.node_removed",
                  {{"file_id", file_id}, {"node_id", node_id}, {"chunks", std::to_string(affected.size())}});
    }

    {
        std::scoped_lock assignments_lock(assignments_mutex_);
        for (auto& [_, holders] : assignments_) {
            std::erase(holders, node_id);
        }
    }
    return queued;
}

std::size_t Coordinator::queue_if_degraded(const manifest::ChunkPlacement& chunk) {
    if (chunk.node_ids.size() >= config_.chunk_redundancy) {
        return 0;
    }
    if (queue_.push(chunk.chunk_id)) {
        log_event(StructuredLogger::Level::Info, "coordinator.heal.queued",
                  {{"chunk_id", chunk.chunk_id}, {"holders", std::to_string(chunk.node_ids.size())}});
        return 1;
    }
    return 0;
}

ApiResult Coordinator::nodes() const {
    json::Value body = json::Value::make_object();
    for (const auto& info : registry_.snapshot()) {
        json::Value entry = json::Value::make_object();
        entry.set("storage_available", json::Value(info.storage_available));
        entry.set("ip", json::Value(info.host));
        entry.set("port", json::Value(static_cast<std::int64_t>(info.port)));
        entry.set("last_seen", json::Value(to_epoch_seconds(info.last_seen)));
        body.set(info.node_id, std::move(entry));
    }
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::locate_chunk(const ChunkId& chunk_id) const {
    std::optional<std::vector<NodeId>> holders;
    {
        std::scoped_lock lock(assignments_mutex_);
        if (const auto it = assignments_.find(chunk_id); it != assignments_.end()) {
            holders = it->second;
        }
    }
    if (!holders) {
        if (auto owner = find_chunk_owner(chunk_id)) {
            holders = owner->manifest.find_chunk(chunk_id)->node_ids;
        }
    }
    if (!holders) {
        return ApiResult::error(404, "ERR_CHUNK_NOT_FOUND", "Chunk not found");
    }
    json::Value body = json::Value::make_object();
    body.set("nodes", string_array(*holders));
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::assign_chunk(const ChunkId& chunk_id, const NodeId& node_id) {
    if (chunk_id.empty() || node_id.empty()) {
        return ApiResult::error(400, "ERR_INVALID_ASSIGNMENT", "chunk_id and node_id are required");
    }
    {
        std::scoped_lock lock(assignments_mutex_);
        auto& holders = assignments_[chunk_id];
        if (std::find(holders.begin(), holders.end(), node_id) == holders.end()) {
            holders.push_back(node_id);
        }
    }
    json::Value body = json::Value::make_object();
    body.set("status", json::Value("chunk assigned"));
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::key_count() const {
    json::Value body = json::Value::make_object();
    body.set("stored_keys", json::Value(manifests_->list().size()));
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::get_manifest(const FileId& file_id) const {
    try {
        return ApiResult::ok(manifests_->load(file_id).to_json());
    } catch (const manifest::ManifestNotFound&) {
        return ApiResult::error(404, "ERR_FILE_NOT_FOUND", "file_id not found");
    } catch (const manifest::ManifestCorrupt& error) {
        return ApiResult::error(500, "ERR_MANIFEST_CORRUPT", error.what());
    }
}

ApiResult Coordinator::upload_file(const std::string& filename, std::span<const std::uint8_t> data) {
    if (filename.empty()) {
        return ApiResult::error(400, "ERR_MISSING_FILENAME", "filename is required");
    }
    if (registry_.empty()) {
        return ApiResult::error(503, "ERR_NO_NODES", "No nodes online");
    }

    const FileId file_id = reserve_file_id();
    const auto file_key = crypto::TokenCipher::generate_key();
    const crypto::TokenCipher cipher(file_key);

    const auto upload_path = config_.temp_upload_directory() / ("temp_" + file_id);
    const auto chunk_dir = config_.temp_chunk_directory() / file_id;
    {
        std::ofstream stream(upload_path, std::ios::binary | std::ios::trunc);
        stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!stream) {
            remove_scratch(upload_path);
            release_file_id(file_id);
            return ApiResult::error(500, "ERR_UPLOAD_SPOOL", "Failed to spool upload to disk");
        }
    }

    manifest::FileManifest manifest;
    manifest.original_filename = filename;
    manifest.encryption_key = crypto::TokenCipher::encode_key(file_key);
    manifest.file_size = data.size();
    manifest.chunk_size = config_.chunk_size_bytes;
    manifest.created_at = now_epoch_seconds();

    std::size_t chunks_stored = 0;
    try {
        const auto chunk_paths = storage::split_file(upload_path, config_.chunk_size_bytes, chunk_dir);
        for (std::size_t index = 0; index < chunk_paths.size(); ++index) {
            const ChunkId chunk_id = make_chunk_id(file_id, index);
            const auto token = cipher.encrypt(read_file_bytes(chunk_paths[index]));

            manifest::ChunkPlacement placement;
            placement.chunk_id = chunk_id;
            for (const auto& node_id : planner_.select_targets(registry_.ids(), config_.chunk_redundancy)) {
                const auto endpoint = endpoint_for(node_id);
                if (!endpoint) {
                    continue;
                }
                const auto outcome = transport_.store_chunk(*endpoint, chunk_id, token);
                if (outcome.ok) {
                    placement.node_ids.push_back(node_id);
                    log_event(StructuredLogger::Level::Debug, "coordinator.upload.chunk_sent",
                              {{"chunk_id", chunk_id}, {"node_id", node_id}});
                } else {
                    log_event(StructuredLogger::Level::Warning, "coordinator.upload.chunk_rejected",
                              {{"chunk_id", chunk_id},
                               {"node_id", node_id},
                               {"status", std::to_string(outcome.status)},
                               {"error", outcome.error}});
                }
            }
            if (placement.node_ids.empty()) {
                log_event(StructuredLogger::Level::Error, "coordinator.upload.chunk_unplaced", {{"chunk_id", chunk_id}});
            } else {
                ++chunks_stored;
            }
            manifest.chunks.push_back(std::move(placement));
        }

        // A holder may have been declared dead while chunks were in flight.
        std::scoped_lock lock(manifest_update_mutex_);
        std::vector<const manifest::ChunkPlacement*> lost_holder;
        for (auto& chunk : manifest.chunks) {
            const auto removed = std::erase_if(chunk.node_ids, [this](const NodeId& node_id) {
                return !registry_.contains(node_id);
            });
            if (removed > 0 && !chunk.node_ids.empty()) {
                lost_holder.push_back(&chunk);
            }
        }
        manifests_->save(file_id, manifest);
        for (const auto* chunk : lost_holder) {
            queue_if_degraded(*chunk);
        }
    } catch (const std::exception& error) {
        remove_scratch(upload_path);
        remove_scratch(chunk_dir);
        release_file_id(file_id);
        log_event(StructuredLogger::Level::Error, "coordinator.upload.failed",
                  {{"file_id", file_id}, {"error", error.what()}});
        return ApiResult::error(500, "ERR_UPLOAD_FAILED", error.what());
    }
    remove_scratch(upload_path);
    remove_scratch(chunk_dir);
    release_file_id(file_id);

    log_event(StructuredLogger::Level::Info, "coordinator.upload.completed",
              {{"file_id", file_id},
               {"filename", filename},
               {"bytes", std::to_string(data.size())},
               {"chunks_stored", std::to_string(chunks_stored)},
               {"chunks_total", std::to_string(manifest.chunks.size())}});

    json::Value body = json::Value::make_object();
    body.set("file_id", json::Value(file_id));
    body.set("chunks_stored", json::Value(chunks_stored));
    body.set("chunks_total", json::Value(manifest.chunks.size()));
    return ApiResult::ok(std::move(body));
}

DownloadResult Coordinator::download_file(const FileId& file_id) const {
    DownloadResult download;
    manifest::FileManifest manifest;
    try {
        manifest = manifests_->load(file_id);
    } catch (const manifest::ManifestNotFound&) {
        download.result = ApiResult::error(404, "ERR_FILE_NOT_FOUND", "File not found");
        return download;
    } catch (const manifest::ManifestCorrupt& error) {
        download.result = ApiResult::error(500, "ERR_MANIFEST_CORRUPT", error.what());
        return download;
    }

    const auto key = crypto::TokenCipher::decode_key(manifest.encryption_key);
    if (!key) {
        download.result = ApiResult::error(500, "ERR_KEY_MISSING", "Encryption key not found");
        return download;
    }
    const crypto::TokenCipher cipher(*key);

    std::vector<ChunkData> pieces;
    pieces.reserve(manifest.chunks.size());
    for (const auto& chunk : manifest.chunks) {
        std::optional<ChunkData> plain;
        for (const auto& node_id : chunk.node_ids) {
            const auto endpoint = endpoint_for(node_id);
            if (!endpoint) {
                continue;
            }
            const auto token = transport_.fetch_chunk(*endpoint, chunk.chunk_id);
            if (!token) {
                continue;
            }
            plain = cipher.decrypt(*token);
            if (plain) {
                break;
            }
            log_event(StructuredLogger::Level::Warning, "coordinator.download.chunk_rejected",
                      {{"chunk_id", chunk.chunk_id}, {"node_id", node_id}, {"reason", "authentication failed"}});
        }
        if (!plain) {
            log_event(StructuredLogger::Level::Error, "coordinator.download.chunk_unavailable",
                      {{"file_id", file_id}, {"chunk_id", chunk.chunk_id}});
            download.result = ApiResult::error(502, "ERR_CHUNK_UNAVAILABLE",
                                               "Failed to fetch chunk " + chunk.chunk_id + " from any node");
            return download;
        }
        pieces.push_back(std::move(*plain));
    }

    download.data = storage::reassemble_bytes(pieces);
    download.filename = manifest.original_filename;
    download.result = ApiResult::ok(json::Value());
    log_event(StructuredLogger::Level::Info, "coordinator.download.completed",
              {{"file_id", file_id}, {"bytes", std::to_string(download.data.size())}});
    return download;
}

ApiResult Coordinator::status() const {
    const auto file_ids = manifests_->list();
    const auto node_ids = registry_.ids();

    json::Value files = json::Value::make_object();
    json::Value errors = json::Value::make_array();
    std::size_t total_chunks = 0;
    for (const auto& file_id : file_ids) {
        try {
            const auto manifest = manifests_->load(file_id);
            json::Value entry = json::Value::make_object();
            entry.set("original_filename", json::Value(manifest.original_filename));
            entry.set("chunk_count", json::Value(manifest.chunks.size()));
            files.set(file_id, std::move(entry));
            total_chunks += manifest.chunks.size();
        } catch (const std::runtime_error& error) {
            json::Value entry = json::Value::make_object();
            entry.set("file_id", json::Value(file_id));
            entry.set("error", json::Value(std::string(error.what())));
            errors.push_back(std::move(entry));
        }
    }

    json::Value body = json::Value::make_object();
    body.set("node_count", json::Value(node_ids.size()));
    body.set("registered_nodes", string_array(node_ids));
    body.set("file_count", json::Value(file_ids.size()));
    body.set("files", std::move(files));
    body.set("total_chunks", json::Value(total_chunks));
    body.set("manifest_errors", std::move(errors));
    body.set("healing_queue", json::Value(queue_.size()));
    return ApiResult::ok(std::move(body));
}

ApiResult Coordinator::heal_now() {
    std::size_t queued = 0;
    for (const auto& file_id : manifests_->list()) {
        try {
            const auto manifest = manifests_->load(file_id);
            for (const auto& chunk : manifest.chunks) {
                if (!chunk.node_ids.empty()) {
                    queued += queue_if_degraded(chunk);
                }
            }
        } catch (const std::runtime_error& error) {
            log_event(StructuredLogger::Level::Warning, "coordinator.heal.scan_skipped",
                      {{"file_id", file_id}, {"error", error.what()}});
        }
    }
    queue_.notify();
    log_event(StructuredLogger::Level::Info, "coordinator.heal.requested", {{"queued", std::to_string(queued)}});

    json::Value body = json::Value::make_object();
    body.set("status", json::Value("Healing started in background"));
    body.set("queued", json::Value(queued));
    return ApiResult::ok(std::move(body));
}

HealOutcome Coordinator::heal_chunk(const ChunkId& chunk_id) {
    auto owner = find_chunk_owner(chunk_id);
    if (!owner) {
        log_event(StructuredLogger::Level::Warning, "coordinator.heal.unknown_chunk", {{"chunk_id", chunk_id}});
        return HealOutcome::UnknownChunk;
    }
    const auto holders = owner->manifest.find_chunk(chunk_id)->node_ids;
    std::size_t needed = holders.size() >= config_.chunk_redundancy ? 0 : config_.chunk_redundancy - holders.size();
    if (needed == 0) {
        log_event(StructuredLogger::Level::Debug, "coordinator.heal.already_healthy", {{"chunk_id", chunk_id}});
        return HealOutcome::AlreadyHealthy;
    }
    if (holders.empty()) {
        log_event(StructuredLogger::Level::Error, "coordinator.heal.unhealable",
                  {{"chunk_id", chunk_id}, {"file_id", owner->file_id}});
        return HealOutcome::Unhealable;
    }

    std::vector<NodeId> live_donors;
    for (const auto& node_id : holders) {
        if (registry_.contains(node_id)) {
            live_donors.push_back(node_id);
        }
    }
    if (live_donors.empty()) {
        log_event(StructuredLogger::Level::Warning, "coordinator.heal.no_live_donor", {{"chunk_id", chunk_id}});
        return HealOutcome::NoLiveDonor;
    }

    std::vector<NodeId> added;
    for (const auto& target_id : planner_.select_heal_targets(registry_.ids(), holders)) {
        if (needed == 0) {
            break;
        }
        const auto donor_id = planner_.pick_donor(live_donors);
        if (!donor_id) {
            break;
        }
        const auto donor = endpoint_for(*donor_id);
        const auto target = endpoint_for(target_id);
        if (!donor || !target) {
            continue;
        }
        const auto data = transport_.fetch_chunk(*donor, chunk_id);
        if (!data) {
            log_event(StructuredLogger::Level::Warning, "coordinator.heal.fetch_failed",
                      {{"chunk_id", chunk_id}, {"donor", *donor_id}});
            continue;
        }
        const auto outcome = transport_.store_chunk(*target, chunk_id, *data);
        if (!outcome.ok) {
            log_event(StructuredLogger::Level::Warning, "coordinator.heal.store_failed",
                      {{"chunk_id", chunk_id}, {"target", target_id}, {"error", outcome.error}});
            continue;
        }
        added.push_back(target_id);
        live_donors.push_back(target_id);
        --needed;
        log_event(StructuredLogger::Level::Info, "coordinator.heal.replicated",
                  {{"chunk_id", chunk_id}, {"donor", *donor_id}, {"target", target_id}});
    }

    if (!added.empty()) {
        // Merge into the current manifest; it may have changed while copying.
        std::scoped_lock lock(manifest_update_mutex_);
        try {
            auto current = manifests_->load(owner->file_id);
            if (auto* chunk = current.find_chunk(chunk_id)) {
                for (const auto& node_id : added) {
                    if (!chunk->held_by(node_id)) {
                        chunk->node_ids.push_back(node_id);
                    }
                }
                manifests_->update(owner->file_id, current);
            }
        } catch (const manifest::ManifestNotFound&) {
            log_event(StructuredLogger::Level::Warning, "coordinator.heal.manifest_vanished",
                      {{"file_id", owner->file_id}});
        }
    }
    return needed == 0 ? HealOutcome::Healed : HealOutcome::Partial;
}

bool Coordinator::heal_next(std::chrono::milliseconds timeout) {
    const auto chunk_id = queue_.pop_wait(timeout);
    if (!chunk_id) {
        return false;
    }
    log_event(StructuredLogger::Level::Info, "coordinator.heal.started",
              {{"chunk_id", *chunk_id}, {"remaining", std::to_string(queue_.size())}});
    const auto outcome = heal_chunk(*chunk_id);
    log_event(StructuredLogger::Level::Info, "coordinator.heal.finished",
              {{"chunk_id", *chunk_id}, {"outcome", std::string(heal_outcome_to_string(outcome))}});
    return true;
}

void Coordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    healer_ = std::thread(&Coordinator::healing_loop, this);
}

void Coordinator::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.notify();
    if (healer_.joinable()) {
        healer_.join();
    }
}

bool Coordinator::running() const noexcept {
    return running_.load();
}

void Coordinator::healing_loop() {
    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(config_.heal_idle_interval);
    while (running_.load()) {
        try {
            sweep_expired();
            heal_next(idle);
        } catch (const std::exception& error) {
            log_event(StructuredLogger::Level::Error, "coordinator.heal.loop_error", {{"error", error.what()}});
        }
    }
}

std::optional<Coordinator::LocatedChunk> Coordinator::find_chunk_owner(const ChunkId& chunk_id) const {
    for (const auto& file_id : manifests_->list()) {
        try {
            auto manifest = manifests_->load(file_id);
            if (manifest.find_chunk(chunk_id)) {
                return LocatedChunk{file_id, std::move(manifest)};
            }
        } catch (const std::runtime_error& error) {
            log_event(StructuredLogger::Level::Debug, "coordinator.manifest.skipped",
                      {{"file_id", file_id}, {"error", error.what()}});
        }
    }
    return std::nullopt;
}

void Coordinator::set_file_id_source(std::function<FileId()> source) {
    std::scoped_lock lock(pending_uploads_mutex_);
    file_id_source_ = std::move(source);
}

// Chunk ids derive from the file id, so a reused id would overwrite another file's chunks on the nodes.
FileId Coordinator::reserve_file_id() {
    std::scoped_lock lock(pending_uploads_mutex_);
    while (true) {
        auto file_id = file_id_source_();
        if (manifests_->contains(file_id) || pending_uploads_.contains(file_id)) {
            log_event(StructuredLogger::Level::Debug, "coordinator.upload.file_id_collision", {{"file_id", file_id}});
            continue;
        }
        pending_uploads_.insert(file_id);
        return file_id;
    }
}

void Coordinator::release_file_id(const FileId& file_id) {
    std::scoped_lock lock(pending_uploads_mutex_);
    pending_uploads_.erase(file_id);
}

std::optional<net::NodeEndpoint> Coordinator::endpoint_for(const NodeId& node_id) const {
    const auto info = registry_.find(node_id);
    if (!info) {
        return std::nullopt;
    }
    return net::NodeEndpoint{info->node_id, info->host, info->port};
}

}  // namespace chunknet::coordinator
