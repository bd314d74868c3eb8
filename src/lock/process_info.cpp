/**
 * @file process_info.cpp
 * @brief POSIX implementation of process identity queries
 */

#include <kcenon/file_delivery/lock/process_info.h>

#include <cerrno>
#include <climits>

#include <signal.h>
#include <unistd.h>

namespace kcenon::file_delivery::process_info {

auto current_pid() -> int64_t {
    return static_cast<int64_t>(::getpid());
}

auto local_hostname() -> std::string {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "unknown-host";
    }
    return std::string(buf);
}

auto is_process_alive(int64_t pid) -> bool {
    if (pid <= 0 || pid > INT_MAX) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

}  // namespace kcenon::file_delivery::process_info
