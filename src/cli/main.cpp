#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

const char *const USAGE = "Usage:\n"
                          "  pillboxctl [--sock <path>] <command> [args]\n"
                          "\n"
                          "Commands:\n"
                          "  send <schedule-file>      upload a schedule, prints PROGRESS k/N\n"
                          "  cancel                    abort the running upload\n"
                          "  status                    transfer state and link state\n"
                          "  peers                     dispensers seen by the BLE scan\n"
                          "  connect AA:BB:CC:DD:EE:FF select the dispenser\n"
                          "  disconnect                drop the dispenser link\n"
                          "  quit                      stop pillboxd\n";

struct Invocation
{
    std::string              sock;
    std::vector<std::string> words;  // command followed by its arguments
    bool                     help = false;
};

// false on a malformed command line (usage already printed)
bool parse_cli(int argc, char **argv, Invocation &out)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            out.help = true;
            return true;
        }
        if (a != "--sock")
        {
            out.words.push_back(a);
            continue;
        }
        if (i + 1 >= argc)
        {
            std::fputs(USAGE, stderr);
            std::fprintf(stderr, "error: --sock needs a path\n");
            return false;
        }
        out.sock = ipc::expand_user(argv[++i]);
    }
    if (out.words.empty())
    {
        std::fputs(USAGE, stderr);
        return false;
    }
    return true;
}

// Each entry turns the command arguments into the control line for pillboxd.
// nullopt means the arguments were rejected and a message was printed.
using LineBuilder = std::function<std::optional<std::string>(const std::vector<std::string> &)>;

std::optional<std::string> bare(const std::vector<std::string> &w, const char *line)
{
    if (w.size() != 1)
    {
        std::fprintf(stderr, "error: '%s' takes no arguments\n", w[0].c_str());
        return std::nullopt;
    }
    return std::string(line);
}

const std::unordered_map<std::string, LineBuilder> &command_table()
{
    static const std::unordered_map<std::string, LineBuilder> table = {
        {"send",
         [](const std::vector<std::string> &w) -> std::optional<std::string> {
             if (w.size() != 2)
             {
                 std::fprintf(stderr, "error: send needs exactly one schedule file\n");
                 return std::nullopt;
             }
             // pillboxd has its own working directory
             std::error_code ec;
             const auto      abs = std::filesystem::absolute(w[1], ec);
             if (ec)
             {
                 std::fprintf(stderr, "error: bad path %s: %s\n", w[1].c_str(),
                              ec.message().c_str());
                 return std::nullopt;
             }
             return "SEND " + abs.lexically_normal().string();
         }},
        {"connect",
         [](const std::vector<std::string> &w) -> std::optional<std::string> {
             const std::string mac = w.size() == 2 ? upper_mac(w[1]) : std::string();
             if (!is_valid_mac(mac))
             {
                 std::fprintf(stderr, "error: connect needs a MAC like AA:BB:CC:DD:EE:FF\n");
                 return std::nullopt;
             }
             return "CONNECT " + mac;
         }},
        {"cancel", [](const std::vector<std::string> &w) { return bare(w, "CANCEL"); }},
        {"status", [](const std::vector<std::string> &w) { return bare(w, "STATUS"); }},
        {"peers", [](const std::vector<std::string> &w) { return bare(w, "PEERS"); }},
        {"disconnect", [](const std::vector<std::string> &w) { return bare(w, "DISCONNECT"); }},
        {"quit", [](const std::vector<std::string> &w) { return bare(w, "QUIT"); }},
    };
    return table;
}

// ======================================================================
// Function: talk_to_daemon
// - In: socket path, one control line
// - Out: exit code; every reply line is echoed to stdout as it arrives
// - Note: the last reply decides, "FAIL ..." is transfer_failed
// ======================================================================
int talk_to_daemon(const std::string &sock, const std::string &line)
{
    std::string last;
    const bool  reached = ipc::request(sock, line, [&last](const std::string &reply) {
        std::printf("%s\n", reply.c_str());
        std::fflush(stdout);
        last = reply;
    });
    if (!reached)
    {
        std::fprintf(stderr, "error: pillboxd not reachable at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return last.rfind("FAIL", 0) == 0 ? exitc::transfer_failed : exitc::ok;
}
}  // namespace

int main(int argc, char **argv)
{
    // stdout carries the replies; stay quiet on stderr unless asked
    const char *lvl = std::getenv("PILLBOX_LOG_LEVEL");
    pillbox::set_log_level_by_name(lvl ? lvl : "error");
    pillbox::set_log_tag("pillboxctl");

    Invocation inv;
    if (!parse_cli(argc, argv, inv))
        return exitc::bad_args;
    if (inv.help)
    {
        std::fputs(USAGE, stdout);
        return exitc::ok;
    }

    const auto &table = command_table();
    auto        it    = table.find(inv.words[0]);
    if (it == table.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", inv.words[0].c_str());
        std::fputs(USAGE, stderr);
        return exitc::bad_args;
    }
    const std::optional<std::string> line = it->second(inv.words);
    if (!line)
        return exitc::bad_args;

    // --sock wins over PILLBOX_CTL_SOCK and the default
    const std::string sock = inv.sock.empty() ? ipc::expand_user(constants::ctl_sock_path())
                                              : inv.sock;
    LOG_DEBUG("%s -> %s", line->c_str(), sock.c_str());
    return talk_to_daemon(sock, *line);
}
