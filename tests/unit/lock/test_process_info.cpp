/**
 * @file test_process_info.cpp
 * @brief Unit tests for process identity queries
 */

#include <gtest/gtest.h>

#include <kcenon/file_delivery/lock/process_info.h>

#include <sys/wait.h>
#include <unistd.h>

namespace kcenon::file_delivery::test {

TEST(ProcessInfoTest, CurrentPidIsAlive) {
    auto pid = process_info::current_pid();
    EXPECT_GT(pid, 0);
    EXPECT_TRUE(process_info::is_process_alive(pid));
}

TEST(ProcessInfoTest, InvalidPidsAreNotAlive) {
    EXPECT_FALSE(process_info::is_process_alive(0));
    EXPECT_FALSE(process_info::is_process_alive(-1));
    EXPECT_FALSE(process_info::is_process_alive(int64_t{1} << 40));
}

TEST(ProcessInfoTest, ReapedChildIsNotAlive) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);

    EXPECT_FALSE(process_info::is_process_alive(child));
}

TEST(ProcessInfoTest, HostnameIsNotEmpty) {
    EXPECT_FALSE(process_info::local_hostname().empty());
}

}  // namespace kcenon::file_delivery::test
