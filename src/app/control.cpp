#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

#include "app/control.hpp"
#include "transport/bluez_channel.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

namespace app
{
namespace
{
std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return {};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

bool read_file(const std::string &path, framer::Payload &out, std::string &err)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = std::string("cannot open ") + path + ": " + std::strerror(errno);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        err = std::string("cannot read ") + path;
        return false;
    }
    return true;
}
}  // namespace

// ======================================================================
// Function: ControlHandler::handle_send
// - In: "SEND <abs-path>" argument, reply writer of this connection
// - Out: PROGRESS k/N per frame, then OK or FAIL <detail>
// - Note: keeps waiting for the result even if the client went away
// ======================================================================
void ControlHandler::handle_send(const std::string &arg, const ipc::Reply &reply)
{
    const std::string path = trim(arg);
    if (path.empty() || path[0] != '/')
    {
        LOG_WARN("CMD: SEND needs an absolute path, got '%s'", path.c_str());
        reply("FAIL expected an absolute schedule path");
        return;
    }

    framer::Payload schedule;
    std::string     err;
    if (!read_file(path, schedule, err))
    {
        LOG_ERROR("CMD: SEND %s", err.c_str());
        reply("FAIL " + err);
        return;
    }

    if (quitting_.load())
    {
        LOG_INFO("CMD: SEND %s refused, daemon is shutting down", path.c_str());
        reply("FAIL shutting down");
        return;
    }

    LOG_INFO("CMD: SEND %s (%zu bytes)", path.c_str(), schedule.size());
    transfer::TransferHandle h;
    const transfer::Status   st = svc_.send_schedule(schedule, h);
    if (st != transfer::Status::Ok)
    {
        reply(std::string("FAIL ") + transfer::to_string(st));
        return;
    }
    // QUIT may have cancelled just before this transfer began
    if (quitting_.load())
        (void)svc_.cancel();

    bool                    client_up = true;
    transfer::ProgressEvent ev;
    while (h.progress().next(ev))
    {
        if (client_up)
            client_up = reply("PROGRESS " + std::to_string(ev.seq) + "/" +
                              std::to_string(ev.total));
    }
    const transfer::TransferResult r = h.completion().get();
    if (r.success)
        reply("OK");
    else
        reply("FAIL " + r.detail.value_or(transfer::to_string(r.outcome)));
}

void ControlHandler::handle_link(const std::string &line, const ipc::Reply &reply)
{
    auto *bt = dynamic_cast<transport::BluezChannel *>(&svc_.channel());
    if (!bt)
    {
        reply("FAIL not supported on this transport");
        return;
    }

    if (line == "PEERS")
    {
        bt->request_candidate_refresh();  // non-blocking poke
        for (const auto &p : bt->list_peers())
        {
            reply("PEER " + p.addr + " rssi=" + std::to_string(p.rssi) +
                  " name=" + (p.name.empty() ? "?" : p.name));
        }
        reply("OK");
        return;
    }

    std::string mac;
    if (line != "DISCONNECT")
    {
        mac = upper_mac(trim(line.substr(7)));
        if (!is_valid_mac(mac))
        {
            LOG_WARN("[CONNECT] invalid MAC address: %s", mac.c_str());
            reply("FAIL invalid MAC address");
            return;
        }
    }
    if (bt->connect_to(mac))
        reply("OK");
    else
        reply("FAIL link control failed");
}

void ControlHandler::on_line(const std::string &line, const ipc::Reply &reply)
{
    LOG_DEBUG("IPC line: %s", line.c_str());

    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        quitting_.store(true);
        // a SEND still streaming ends as cancelled, so the server can join its worker
        (void)svc_.cancel();
        reply("OK");
        return;
    }
    if (line.rfind("SEND ", 0) == 0)
    {
        handle_send(line.substr(5), reply);
        return;
    }
    if (line == "CANCEL")
    {
        if (svc_.cancel())
            reply("OK");
        else
            reply("FAIL no active transfer");
        return;
    }
    if (line == "STATUS")
    {
        const StatusReport s = svc_.status();
        reply(std::string("STATE ") + transfer::to_string(s.state) + " CONNECTED " +
              (s.connected ? "1" : "0") + " TRANSPORT " + s.transport);
        return;
    }
    if (line == "PEERS" || line == "DISCONNECT" || line.rfind("CONNECT", 0) == 0)
    {
        handle_link(line, reply);
        return;
    }

    LOG_WARN("CMD: unknown line '%s'", line.c_str());
    reply("FAIL unknown command");
}

}  // namespace app
