/**
 * @file boundary_adapter.cpp
 * @brief RuntimeRegistry and BoundaryHandle implementation.
 * @author Dimitris Kafetzis
 */

#include "ffi/boundary_adapter.hpp"
#include "telemetry/log_sinks.hpp"

#include <exception>

namespace lan_discovery {

// ─────────────────────────────────────────────
// RuntimeRegistry
// ─────────────────────────────────────────────

std::mutex RuntimeRegistry::mutex_;
std::weak_ptr<Runtime> RuntimeRegistry::instance_;

std::shared_ptr<Runtime> RuntimeRegistry::acquire(size_t worker_threads,
                                                  std::shared_ptr<Logger> logger) {
    std::lock_guard lock(mutex_);
    if (auto existing = instance_.lock()) {
        return existing;
    }
    auto runtime = std::make_shared<Runtime>(worker_threads, std::move(logger));
    instance_ = runtime;
    return runtime;
}

bool RuntimeRegistry::alive() {
    std::lock_guard lock(mutex_);
    return !instance_.expired();
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::shared_ptr<Logger> make_boundary_logger(const LoggingConfig& config) {
    auto level = parse_log_level(config.level).value_or(LogLevel::Warn);

    std::unique_ptr<ILogSink> sink;
    if (!config.log_dir.empty()) {
        sink = std::make_unique<JsonFileSink>(config.log_dir, "lan_discovery",
                                              config.max_file_size_mb, config.rotate_count);
    } else {
        sink = std::make_unique<StderrSink>();
    }
    return std::make_shared<Logger>(std::move(sink), level);
}

// ─────────────────────────────────────────────
// BoundaryHandle
// ─────────────────────────────────────────────

BoundaryHandle::BoundaryHandle(std::shared_ptr<Runtime> runtime,
                               std::shared_ptr<DiscoveryEngine> engine,
                               std::shared_ptr<Logger> logger)
    : runtime_(std::move(runtime))
    , logger_(std::move(logger))
    , engine_(std::move(engine)) {}

BoundaryHandle::~BoundaryHandle() {
    if (engine_) {
        engine_->stop();
    }
}

Result<std::unique_ptr<BoundaryHandle>> BoundaryHandle::open(uint16_t port,
                                                             std::string_view name,
                                                             const std::filesystem::path& config_path) {
    if (!is_valid_utf8(name)) {
        return Error{ErrorKind::InvalidArgument, "Announcement name is not valid UTF-8"};
    }

    Config config = default_config();
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            return loaded.error();
        }
        config = std::move(*loaded);
    } else {
        // Embedded hosts own stdout/stderr; stay quiet unless configured
        config.logging.level = "warn";
    }
    config.node.name = std::string(name);
    config.node.service_port = port;

    std::shared_ptr<Logger> logger;
    try {
        logger = make_boundary_logger(config.logging);
    } catch (const std::exception& e) {
        return Error{ErrorKind::Config, std::string("Cannot open log sink: ") + e.what()};
    }

    auto runtime = RuntimeRegistry::acquire(config.runtime.worker_threads, logger);

    Result<std::shared_ptr<DiscoveryEngine>> engine =
        Error{ErrorKind::Setup, "Engine construction did not run"};
    try {
        engine = runtime->submit([&runtime, &config, &logger] {
            auto created = DiscoveryEngine::create(runtime->context(),
                                                   config.node.service_port,
                                                   config.node.name,
                                                   config.discovery,
                                                   logger);
            if (created) {
                (*created)->start();
            }
            return created;
        }).get();
    } catch (const std::exception& e) {
        return Error{ErrorKind::Setup, std::string("Engine construction threw: ") + e.what()};
    }

    if (!engine) {
        logger->error("Discovery setup failed: " + engine.error().message);
        return engine.error();
    }

    return std::unique_ptr<BoundaryHandle>(
        new BoundaryHandle(std::move(runtime), std::move(*engine), std::move(logger)));
}

Result<std::vector<uint8_t>> BoundaryHandle::peers_json() {
    try {
        return runtime_->submit([engine = engine_] {
            return engine->peers_as_bytes();
        }).get();
    } catch (const std::exception& e) {
        return Error{ErrorKind::Io, std::string("Peer snapshot failed: ") + e.what()};
    }
}

Result<void> BoundaryHandle::set_announcement(uint16_t port, std::string_view name) {
    if (!is_valid_utf8(name)) {
        return Error{ErrorKind::InvalidArgument, "Announcement name is not valid UTF-8"};
    }
    engine_->update_local_announcement(Announcement{.name = std::string(name), .port = port});
    return {};
}

}  // namespace lan_discovery
