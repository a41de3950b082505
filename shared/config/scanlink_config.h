#ifndef SCANLINK_CONFIG_H
#define SCANLINK_CONFIG_H

// Protocol defaults shared by the device manager and the device SDK.
// Runtime configuration files may override the timing values.

// Handshake headers carried on the WebSocket upgrade request
#define SCANLINK_HEADER_DEVICE_ID "device-id"
#define SCANLINK_HEADER_DEVICE_TOKEN "device-token"

#define SCANLINK_DEFAULT_WEBSOCKET_PATH "/api/v1/device/ws"
#define SCANLINK_DEFAULT_SERVER_PORT 8000

// WebSocket close codes
#define SCANLINK_CLOSE_NORMAL 1000
#define SCANLINK_CLOSE_GOING_AWAY 1001
#define SCANLINK_CLOSE_POLICY_VIOLATION 1008
#define SCANLINK_AUTH_FAILURE_REASON "Invalid device_id or device_token"
#define SCANLINK_SUPERSEDED_REASON "Superseded by a new connection"
#define SCANLINK_SHUTDOWN_REASON "Device manager shutting down"

// Liveness
#define SCANLINK_HEARTBEAT_INTERVAL_S 15
#define SCANLINK_LIVENESS_SWEEP_INTERVAL_S 30
#define SCANLINK_LIVENESS_TIMEOUT_S 60
#define SCANLINK_RECONNECT_DELAY_S 5

// File transfer
#define SCANLINK_CHUNK_SIZE (1024 * 1024)
#define SCANLINK_UPLOAD_MAX_ATTEMPTS 3
#define SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT 30
#define SCANLINK_UPLOAD_BACKOFF_UNIT_MS 1000
#define SCANLINK_PART_SUFFIX ".part"
#define SCANLINK_DEVICE_PARAMETER_FILE "device_parameter.json"

#define SCANLINK_CONTENT_TYPE_MRD "application/x-ismrmrd+hdf5"
#define SCANLINK_CONTENT_TYPE_OCTET "application/octet-stream"

// Credential hashing
#define SCANLINK_SALT_BYTES 16
#define SCANLINK_DEFAULT_HASH_ITERATIONS 100000

#endif // SCANLINK_CONFIG_H
