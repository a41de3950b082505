#ifndef SCANLINK_SDK_H
#define SCANLINK_SDK_H

/**
 * ScanLink device SDK
 *
 * Example:
 *   auto config = scanlink::sdk::ClientConfig::from_file("device.json");
 *   scanlink::sdk::WebSocketTransport transport(config->endpoint);
 *   scanlink::sdk::DeviceClient client(*config, transport,
 *       [](const scanlink::protocol::AcquisitionPayload &task, scanlink::sdk::CancellationToken &token) {
 *           // acquire, report progress, upload results
 *       });
 *   client.start();
 */

#include "core/client_config.h"
#include "core/device_client.h"
#include "core/device_state_machine.h"
#include "core/file_uploader.h"
#include "core/scan_task.h"
#include "transport/transport_interface.h"
#include "transport/websocket_transport.h"

#endif // SCANLINK_SDK_H
