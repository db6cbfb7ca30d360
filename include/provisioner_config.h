/**
 * @file provisioner_config.h
 * @brief Compile-time configuration for the Hotspot Provisioner firmware
 *
 * Every value can be overridden with a -D build flag. Runtime Config
 * structs in each module take their defaults from here.
 *
 * Roles:
 *   PROV_ROLE_HOST - creates the soft AP and serves POST /provision
 *   PROV_ROLE_PEER - joins the host AP and pushes a provisioning payload
 */

#ifndef PROVISIONER_CONFIG_H
#define PROVISIONER_CONFIG_H

// ============================================================================
// Device Role
// ============================================================================

#define PROV_ROLE_HOST 1
#define PROV_ROLE_PEER 2

#ifndef PROV_DEVICE_ROLE
#define PROV_DEVICE_ROLE PROV_ROLE_HOST
#endif

// ============================================================================
// Control Plane
// ============================================================================

#ifndef PROV_CONTROL_PORT
#define PROV_CONTROL_PORT 8989
#endif

#ifndef PROV_CONTROL_PATH
#define PROV_CONTROL_PATH "/provision"
#endif

// Largest request body the listener reads (bytes)
#ifndef PROV_MAX_BODY_BYTES
#define PROV_MAX_BODY_BYTES 4096
#endif

// ============================================================================
// Access Point (host)
// ============================================================================

// Preferred credentials; the driver falls back to platform-assigned ones
#ifndef PROV_AP_SSID
#define PROV_AP_SSID "LanDiscoveryAP"
#endif

#ifndef PROV_AP_PASSPHRASE
#define PROV_AP_PASSPHRASE "lan123456"
#endif

// Prefix for the fallback SSID (suffix = last 2 MAC bytes)
#ifndef PROV_AP_FALLBACK_PREFIX
#define PROV_AP_FALLBACK_PREFIX "LanDiscovery"
#endif

#ifndef PROV_AP_GATEWAY
#define PROV_AP_GATEWAY "192.168.49.1"
#endif

#ifndef PROV_AP_NETMASK
#define PROV_AP_NETMASK "255.255.255.0"
#endif

#ifndef PROV_AP_CHANNEL
#define PROV_AP_CHANNEL 6
#endif

#ifndef PROV_AP_MAX_CLIENTS
#define PROV_AP_MAX_CLIENTS 4
#endif

// ============================================================================
// Attachment + Sender (peer)
// ============================================================================

// Empty string = use the gateway reported by the attachment
#ifndef PROV_TARGET_HOST
#define PROV_TARGET_HOST PROV_AP_GATEWAY
#endif

#ifndef PROV_TARGET_PORT
#define PROV_TARGET_PORT PROV_CONTROL_PORT
#endif

#ifndef PROV_CONNECT_TIMEOUT_MS
#define PROV_CONNECT_TIMEOUT_MS 5000
#endif

#ifndef PROV_READ_TIMEOUT_MS
#define PROV_READ_TIMEOUT_MS 5000
#endif

// How long a network request may stay unanswered before it is Unavailable
#ifndef PROV_ATTACH_TIMEOUT_MS
#define PROV_ATTACH_TIMEOUT_MS 20000
#endif

// ============================================================================
// Logging
// ============================================================================

// 1 = print passphrases in status log lines (off: masked)
#ifndef PROV_LOG_SECRETS
#define PROV_LOG_SECRETS 0
#endif

// Max lines kept in the event history (0 = unbounded)
#ifndef PROV_LOG_HISTORY_LIMIT
#define PROV_LOG_HISTORY_LIMIT 0
#endif

// ============================================================================
// Tasks
// ============================================================================

#ifndef PROV_WORKER_STACK_SIZE
#define PROV_WORKER_STACK_SIZE 8192
#endif

#ifndef PROV_WORKER_PRIORITY
#define PROV_WORKER_PRIORITY 2
#endif

#ifndef PROV_WORKER_QUEUE_LEN
#define PROV_WORKER_QUEUE_LEN 4
#endif

#endif // PROVISIONER_CONFIG_H
