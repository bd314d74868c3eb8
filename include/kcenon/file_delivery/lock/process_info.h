/**
 * @file process_info.h
 * @brief Process identity and liveness queries used by the instance lock
 */

#ifndef KCENON_FILE_DELIVERY_LOCK_PROCESS_INFO_H
#define KCENON_FILE_DELIVERY_LOCK_PROCESS_INFO_H

#include <cstdint>
#include <string>

namespace kcenon::file_delivery::process_info {

[[nodiscard]] auto current_pid() -> int64_t;

/**
 * @brief Host name of this machine, or "unknown-host" if it cannot be read
 */
[[nodiscard]] auto local_hostname() -> std::string;

/**
 * @brief Check whether a process with the given id exists on this host
 *
 * A process that exists but belongs to another user counts as alive.
 */
[[nodiscard]] auto is_process_alive(int64_t pid) -> bool;

}  // namespace kcenon::file_delivery::process_info

#endif  // KCENON_FILE_DELIVERY_LOCK_PROCESS_INFO_H
