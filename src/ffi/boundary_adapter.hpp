/**
 * @file boundary_adapter.hpp
 * @brief Bridge from synchronous foreign callers into the asio runtime.
 * @author Dimitris Kafetzis
 *
 * The C ABI in lan_discovery.h is a thin shell over these types. Keeping
 * the logic here lets the tests drive it without going through raw
 * pointers.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/runtime.hpp"
#include "network/announcement_codec.hpp"
#include "network/discovery_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lan_discovery {

// ─────────────────────────────────────────────
// RuntimeRegistry
// ─────────────────────────────────────────────

/**
 * @brief Process-wide, reference-counted Runtime.
 *
 * The first acquire() builds the runtime; it is destroyed (and its workers
 * joined) when the last shared_ptr handed out is released.
 */
class RuntimeRegistry {
public:
    static std::shared_ptr<Runtime> acquire(size_t worker_threads = 0,
                                            std::shared_ptr<Logger> logger = nullptr);

    /// True while any handle keeps the runtime alive.
    [[nodiscard]] static bool alive();

private:
    static std::mutex mutex_;
    static std::weak_ptr<Runtime> instance_;
};

// ─────────────────────────────────────────────
// BoundaryHandle
// ─────────────────────────────────────────────

/**
 * @brief The object behind an opaque DiscoveryHandle*.
 *
 * Member order matters: the engine is stopped and released before the
 * runtime reference, so the last handle tears the runtime down with no
 * engine handler left to run.
 */
class BoundaryHandle {
public:
    /**
     * @brief Build, start and wrap an engine.
     *
     * `config_path` empty means defaults. All failures come back as errors,
     * never exceptions.
     */
    static Result<std::unique_ptr<BoundaryHandle>> open(uint16_t port,
                                                        std::string_view name,
                                                        const std::filesystem::path& config_path = {});

    ~BoundaryHandle();

    BoundaryHandle(const BoundaryHandle&) = delete;
    BoundaryHandle& operator=(const BoundaryHandle&) = delete;

    /// Serialized peer snapshot, produced on a runtime worker.
    Result<std::vector<uint8_t>> peers_json();

    Result<void> set_announcement(uint16_t port, std::string_view name);

    [[nodiscard]] DiscoveryEngine& engine() noexcept { return *engine_; }
    [[nodiscard]] Logger& logger() noexcept { return *logger_; }

private:
    BoundaryHandle(std::shared_ptr<Runtime> runtime,
                   std::shared_ptr<DiscoveryEngine> engine,
                   std::shared_ptr<Logger> logger);

    std::shared_ptr<Runtime> runtime_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<DiscoveryEngine> engine_;
};

/**
 * @brief Logger for embedded use: rotating file if `log_dir` is set,
 * otherwise stderr.
 */
std::shared_ptr<Logger> make_boundary_logger(const LoggingConfig& config);

}  // namespace lan_discovery
