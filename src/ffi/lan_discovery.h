/**
 * @file lan_discovery.h
 * @brief C ABI for embedding LAN peer discovery in a foreign host.
 * @author Dimitris Kafetzis
 *
 * Every call is synchronous from the caller's point of view. Handles share a
 * process-wide worker runtime that lives as long as at least one handle does.
 *
 * Ownership:
 *   - discovery_new*() returns a handle owned by the caller; release it with
 *     discovery_free() exactly once.
 *   - discovery_get_peers_json() hands back a buffer owned by the caller;
 *     release it with discovery_free_buf() exactly once.
 * Passing a freed handle or buffer is undefined behaviour.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define DISCOVERY_OK 0
#define DISCOVERY_ERR_INVALID_ARGUMENT (-1)
#define DISCOVERY_ERR_INTERNAL (-2)

typedef struct DiscoveryHandle DiscoveryHandle;

/**
 * Create and start a discovery engine announcing `name` with service `port`.
 * Returns NULL if `name` is NULL or not UTF-8, or if setup fails.
 */
DiscoveryHandle* discovery_new(uint16_t port, const char* name);

/**
 * As discovery_new(), with intervals, group and logging read from a TOML
 * file. A NULL `config_path` means built-in defaults.
 */
DiscoveryHandle* discovery_new_with_config(uint16_t port, const char* name,
                                           const char* config_path);

/** Stop the engine and release the handle. NULL is a no-op. */
void discovery_free(DiscoveryHandle* handle);

/**
 * Serialize the current peer list as a JSON array of
 * {"addr":"ip:port","name":...,"port":...} into a newly allocated buffer.
 * Returns DISCOVERY_OK, or DISCOVERY_ERR_INVALID_ARGUMENT without touching
 * the out-parameters if any pointer is NULL.
 */
int32_t discovery_get_peers_json(DiscoveryHandle* handle, uint8_t** out_ptr, size_t* out_len);

/** Replace the announced name and service port. */
int32_t discovery_set_announcement(DiscoveryHandle* handle, uint16_t port, const char* name);

/** Release a buffer from discovery_get_peers_json(). NULL is a no-op. */
void discovery_free_buf(uint8_t* ptr, size_t len);

#ifdef __cplusplus
}  // extern "C"
#endif
