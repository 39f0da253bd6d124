#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    std::string saved     = path ? path : "";
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");
    EXPECT_EQ(ipc::expand_user("~other/x"), "~other/x");

    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path  = std::getenv("HOME");
    std::string saved = path ? path : "";
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestIsQuit)
{
    EXPECT_TRUE(ipc::is_quit("QUIT"));
    EXPECT_TRUE(ipc::is_quit("quit"));
    EXPECT_TRUE(ipc::is_quit("  Quit \r\n"));
    EXPECT_FALSE(ipc::is_quit("QUITX"));
    EXPECT_FALSE(ipc::is_quit("QUIT now"));
    EXPECT_FALSE(ipc::is_quit(""));
}

TEST(IPC, TestStartServerAndSendLine)
{
    // temporary socket path
    std::string sock = "/tmp/gattlink-ipc-ut-" + std::to_string(getpid()) + ".sock";

    std::mutex               mu;
    std::vector<std::string> seen;
    std::thread              th([&] {
        ipc::start_server(sock, [&](const std::string &l) {
            std::lock_guard<std::mutex> lk(mu);
            seen.push_back(l);
        });
    });
    for (int i = 0; i < 100 && access(sock.c_str(), F_OK) != 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    ASSERT_TRUE(ipc::send_line(sock, "SCAN 5"));
    ASSERT_TRUE(ipc::send_line(sock, "READ auto\r\n"));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();

    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "SCAN 5");
    EXPECT_EQ(seen[1], "READ auto");
    EXPECT_EQ(seen[2], "QUIT");
}

TEST(IPC, TestSendLineWithoutServer)
{
    std::string sock = "/tmp/gattlink-ipc-none-" + std::to_string(getpid()) + ".sock";
    EXPECT_FALSE(ipc::send_line(sock, "SCAN"));
    EXPECT_FALSE(ipc::send_line(sock, ""));
}
