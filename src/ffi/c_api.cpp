/**
 * @file c_api.cpp
 * @brief extern "C" shell over BoundaryHandle.
 * @author Dimitris Kafetzis
 *
 * No exception crosses this boundary. Failures surface as NULL or a
 * negative status and are logged through the handle's logger where one
 * exists.
 */

#include "ffi/lan_discovery.h"
#include "ffi/boundary_adapter.hpp"
#include "telemetry/log_sinks.hpp"

#include <cstring>
#include <exception>
#include <memory>
#include <string>

using namespace lan_discovery;

struct DiscoveryHandle {
    std::unique_ptr<BoundaryHandle> inner;
};

namespace {

void report(const std::string& message) noexcept {
    try {
        Logger logger(std::make_unique<StderrSink>(), LogLevel::Warn);
        logger.error(message);
    } catch (const std::exception&) {
        // stderr itself failed; nowhere left to report
    }
}

DiscoveryHandle* open_handle(uint16_t port, const char* name, const char* config_path) noexcept {
    if (name == nullptr) {
        return nullptr;
    }
    try {
        std::filesystem::path path = config_path ? std::filesystem::path(config_path)
                                                 : std::filesystem::path{};
        auto handle = BoundaryHandle::open(port, name, path);
        if (!handle) {
            if (handle.error().kind != ErrorKind::InvalidArgument) {
                report("discovery_new failed: " + handle.error().message);
            }
            return nullptr;
        }
        return new DiscoveryHandle{std::move(*handle)};
    } catch (const std::exception& e) {
        report(std::string("discovery_new threw: ") + e.what());
        return nullptr;
    }
}

}  // anonymous namespace

extern "C" {

DiscoveryHandle* discovery_new(uint16_t port, const char* name) {
    return open_handle(port, name, nullptr);
}

DiscoveryHandle* discovery_new_with_config(uint16_t port, const char* name,
                                           const char* config_path) {
    return open_handle(port, name, config_path);
}

void discovery_free(DiscoveryHandle* handle) {
    if (handle == nullptr) return;
    try {
        delete handle;
    } catch (const std::exception& e) {
        report(std::string("discovery_free threw: ") + e.what());
    }
}

int32_t discovery_get_peers_json(DiscoveryHandle* handle, uint8_t** out_ptr, size_t* out_len) {
    if (handle == nullptr || out_ptr == nullptr || out_len == nullptr) {
        return DISCOVERY_ERR_INVALID_ARGUMENT;
    }
    try {
        auto bytes = handle->inner->peers_json();
        if (!bytes) {
            handle->inner->logger().warn(bytes.error().message);
            return DISCOVERY_ERR_INTERNAL;
        }

        auto* buffer = new uint8_t[bytes->empty() ? 1 : bytes->size()];
        if (!bytes->empty()) {
            std::memcpy(buffer, bytes->data(), bytes->size());
        }
        *out_ptr = buffer;
        *out_len = bytes->size();
        return DISCOVERY_OK;
    } catch (const std::exception& e) {
        handle->inner->logger().error(std::string("discovery_get_peers_json threw: ") + e.what());
        return DISCOVERY_ERR_INTERNAL;
    }
}

int32_t discovery_set_announcement(DiscoveryHandle* handle, uint16_t port, const char* name) {
    if (handle == nullptr || name == nullptr) {
        return DISCOVERY_ERR_INVALID_ARGUMENT;
    }
    try {
        auto result = handle->inner->set_announcement(port, name);
        return result ? DISCOVERY_OK : DISCOVERY_ERR_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        handle->inner->logger().error(std::string("discovery_set_announcement threw: ") + e.what());
        return DISCOVERY_ERR_INTERNAL;
    }
}

void discovery_free_buf(uint8_t* ptr, size_t /*len*/) {
    delete[] ptr;
}

}  // extern "C"
