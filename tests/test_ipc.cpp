#include <chrono>
#include <cstdlib>
#include <cstring>
#include <future>
#include <gtest/gtest.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

static std::string temp_sock(const char *tag)
{
    return "/tmp/pillbox-ipc-" + std::string(tag) + "-" + std::to_string(getpid()) + ".sock";
}

static bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    std::string sock = temp_sock("quit");

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    ASSERT_TRUE(wait_for_socket(sock));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, RequestStreamsEveryReplyLine)
{
    std::string sock = temp_sock("req");
    std::thread th([&] {
        ipc::start_server(sock, [](const std::string &line, const ipc::Reply &reply) {
            if (line == "SEND /tmp/s.json")
            {
                reply("PROGRESS 1/2");
                reply("PROGRESS 2/2");
                reply("OK");
            }
            else if (line == "QUIT")
            {
                reply("OK");
            }
            else
            {
                reply("FAIL unknown command");
            }
        });
    });
    ASSERT_TRUE(wait_for_socket(sock));

    std::vector<std::string> got;
    ASSERT_TRUE(
        ipc::request(sock, "SEND /tmp/s.json", [&](const std::string &l) { got.push_back(l); }));
    EXPECT_EQ(got, (std::vector<std::string>{"PROGRESS 1/2", "PROGRESS 2/2", "OK"}));

    got.clear();
    ASSERT_TRUE(ipc::request(sock, "BOGUS", [&](const std::string &l) { got.push_back(l); }));
    EXPECT_EQ(got, (std::vector<std::string>{"FAIL unknown command"}));

    got.clear();
    ASSERT_TRUE(ipc::request(sock, "QUIT", [&](const std::string &l) { got.push_back(l); }));
    EXPECT_EQ(got, (std::vector<std::string>{"OK"}));
    th.join();
}

// connected but never writes a line
static int silent_client(const std::string &sock)
{
    int         fd = socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un sa{};
    sa.sun_family = AF_UNIX;
    std::strncpy(sa.sun_path, sock.c_str(), sizeof(sa.sun_path) - 1);
    if (fd != -1 && connect(fd, reinterpret_cast<sockaddr *>(&sa), sizeof(sa)) == -1)
    {
        close(fd);
        return -1;
    }
    return fd;
}

TEST(IPC, SilentClientDoesNotBlockOthers)
{
    std::string sock = temp_sock("silent");
    std::thread th([&] {
        ipc::start_server(sock, [](const std::string &line, const ipc::Reply &reply) {
            reply(line == "CANCEL" ? "FAIL no active transfer" : "OK");
        });
    });
    ASSERT_TRUE(wait_for_socket(sock));

    const int quiet = silent_client(sock);
    ASSERT_NE(quiet, -1);

    auto fut = std::async(std::launch::async, [&] {
        std::vector<std::string> got;
        ipc::request(sock, "CANCEL", [&](const std::string &l) { got.push_back(l); });
        return got;
    });
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready)
        << "CANCEL not answered while another client is connected";
    EXPECT_EQ(fut.get(), (std::vector<std::string>{"FAIL no active transfer"}));

    std::vector<std::string> got;
    ASSERT_TRUE(ipc::request(sock, "QUIT", [&](const std::string &l) { got.push_back(l); }));
    EXPECT_EQ(got, (std::vector<std::string>{"OK"}));
    close(quiet);
    th.join();
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, RequestWithoutServerFails)
{
    std::string sock = temp_sock("none");
    (void)unlink(sock.c_str());
    EXPECT_FALSE(ipc::request(sock, "STATUS", nullptr));
    EXPECT_FALSE(ipc::send_line(sock, "STATUS"));
}
