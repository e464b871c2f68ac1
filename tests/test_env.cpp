// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("PILLBOX_CTL_SOCK");
    const std::string want = "/tmp/pillbox-test.sock";
    g.set(want);

    // no default notice when the path comes from the environment
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Control socket defaults to") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("PILLBOX_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "pillbox-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/pillbox/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket defaults to " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace pillbox;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
}

TEST(LogLevel, TagPrefixesEveryLine)
{
    pillbox::set_log_level_by_name("DEBUG");
    pillbox::set_log_tag("pillboxd");
    testing::internal::CaptureStderr();
    LOG_INFO("tagged_line");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("<pillboxd>"), std::string::npos);
    EXPECT_NE(out.find("tagged_line"), std::string::npos);

    pillbox::set_log_tag(nullptr);
    testing::internal::CaptureStderr();
    LOG_INFO("untagged_line");
    out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("<pillboxd>"), std::string::npos);
}

TEST(Config, DefaultsWhenUnset)
{
    const char *keys[] = {"PILLBOX_TRANSPORT",      "PILLBOX_ADAPTER",        "PILLBOX_PEER",
                          "PILLBOX_CHUNK_SIZE",     "PILLBOX_FRAME_DELAY_MS", "PILLBOX_ACK_TIMEOUT_MS",
                          "PILLBOX_ACK_MARKER",     "PILLBOX_LOG_LEVEL"};
    std::vector<std::unique_ptr<EnvGuard>> guards;
    for (const char *k : keys)
    {
        guards.push_back(std::make_unique<EnvGuard>(k));
        guards.back()->unset();
    }
    EnvGuard g_sock("PILLBOX_CTL_SOCK");
    g_sock.set("~/pillbox-ut.sock");
    EnvGuard g_home("HOME");
    g_home.set("/tmp/ut-home");

    const app::Config c = app::config_from_env();
    EXPECT_EQ(c.transport, "loopback");
    EXPECT_EQ(c.adapter, "hci0");
    EXPECT_FALSE(c.peer.has_value());
    EXPECT_EQ(c.transfer.chunk_size, 20u);
    EXPECT_EQ(c.transfer.inter_frame_delay, std::chrono::milliseconds(500));
    EXPECT_EQ(c.transfer.timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(c.transfer.ack_marker, "A");
    EXPECT_EQ(c.ctl_sock, "/tmp/ut-home/pillbox-ut.sock");
}

TEST(Config, ReadsOverrides)
{
    EnvGuard t("PILLBOX_TRANSPORT"), a("PILLBOX_ADAPTER"), p("PILLBOX_PEER"),
        cs("PILLBOX_CHUNK_SIZE"), d("PILLBOX_FRAME_DELAY_MS"), to("PILLBOX_ACK_TIMEOUT_MS"),
        m("PILLBOX_ACK_MARKER");
    t.set("bluez");
    a.set("hci1");
    p.set("aa:bb:cc:dd:ee:0f");
    cs.set("180");
    d.set("0");
    to.set("2500");
    m.set("DONE");

    const app::Config c = app::config_from_env();
    EXPECT_EQ(c.transport, "bluez");
    EXPECT_EQ(c.adapter, "hci1");
    ASSERT_TRUE(c.peer.has_value());
    EXPECT_EQ(*c.peer, "AA:BB:CC:DD:EE:0F");
    EXPECT_EQ(c.transfer.chunk_size, 180u);
    EXPECT_EQ(c.transfer.inter_frame_delay, std::chrono::milliseconds(0));
    EXPECT_EQ(c.transfer.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(c.transfer.ack_marker, "DONE");
}

TEST(Config, InvalidValuesFallBackWithWarning)
{
    EnvGuard lvl("PILLBOX_LOG_LEVEL");
    lvl.set("warn");
    EnvGuard t("PILLBOX_TRANSPORT"), p("PILLBOX_PEER"), cs("PILLBOX_CHUNK_SIZE"),
        to("PILLBOX_ACK_TIMEOUT_MS");
    t.set("serial");
    p.set("not-a-mac");
    cs.set("0");
    to.set("10s");

    testing::internal::CaptureStderr();
    const app::Config c   = app::config_from_env();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c.transport, "loopback");
    EXPECT_FALSE(c.peer.has_value());
    EXPECT_EQ(c.transfer.chunk_size, 20u);
    EXPECT_EQ(c.transfer.timeout, std::chrono::milliseconds(10000));
    EXPECT_NE(err.find("PILLBOX_TRANSPORT"), std::string::npos);
    EXPECT_NE(err.find("PILLBOX_PEER"), std::string::npos);
    EXPECT_NE(err.find("PILLBOX_CHUNK_SIZE"), std::string::npos);
    EXPECT_NE(err.find("PILLBOX_ACK_TIMEOUT_MS"), std::string::npos);

    pillbox::set_log_level_by_name("DEBUG");
}

TEST(Config, ParseBounded)
{
    long v = 0;
    EXPECT_TRUE(app::parse_bounded("512", 1, 512, v));
    EXPECT_EQ(v, 512);
    EXPECT_FALSE(app::parse_bounded("513", 1, 512, v));
    EXPECT_FALSE(app::parse_bounded("-1", 0, 10, v));
    EXPECT_FALSE(app::parse_bounded("12ms", 0, 100, v));
    EXPECT_FALSE(app::parse_bounded("", 0, 100, v));
    EXPECT_FALSE(app::parse_bounded(nullptr, 0, 100, v));
    EXPECT_EQ(v, 512);
}
