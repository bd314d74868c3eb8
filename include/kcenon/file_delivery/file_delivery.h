/**
 * @file file_delivery.h
 * @brief Main header for the file delivery agent library
 *
 * Include this header to get the complete public API: the instance lock,
 * the claim store, the remote service client, the upload orchestrator and
 * the run reporter.
 *
 * @code
 * #include <kcenon/file_delivery/file_delivery.h>
 *
 * using namespace kcenon::file_delivery;
 *
 * auto config = delivery_config::builder()
 *     .with_base_directory("/srv/delivery")
 *     .with_server_url("https://ingest.example.com")
 *     .with_api_key(api_key)
 *     .build();
 *
 * upload_orchestrator orchestrator(config.value(),
 *                                  std::make_shared<network_http_client_factory>());
 * auto run = orchestrator.run();
 * @endcode
 */

#ifndef KCENON_FILE_DELIVERY_FILE_DELIVERY_H
#define KCENON_FILE_DELIVERY_FILE_DELIVERY_H

// Core
#include "core/checksum.h"
#include "core/chunk_config.h"
#include "core/chunk_splitter.h"
#include "core/clock.h"
#include "core/logging.h"
#include "core/types.h"
#include "core/version.h"

// Coordination
#include "lock/instance_lock.h"
#include "lock/process_info.h"
#include "storage/claim_store.h"

// Transport
#include "transport/http_client.h"
#include "transport/network_http_client.h"
#include "transport/remote_service_client.h"
#include "transport/remote_types.h"

// Run
#include "client/delivery_config.h"
#include "client/run_result.h"
#include "client/upload_orchestrator.h"
#include "config/config_loader.h"
#include "report/run_reporter.h"

#endif  // KCENON_FILE_DELIVERY_FILE_DELIVERY_H
