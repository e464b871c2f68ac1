#include <memory>
#include <string>
#include <utility>

#include "app/config.hpp"
#include "app/control.hpp"
#include "app/dispenser_service.hpp"
#include "ctl/ipc.hpp"
#include "transport/bluez_channel.hpp"
#include "transport/loopback_channel.hpp"
#include "util/log.hpp"

std::unique_ptr<transport::IChannel> make_channel(const app::Config &cfg)
{
    if (cfg.transport == "bluez")
    {
        transport::BluezConfig bc;
        bc.adapter   = cfg.adapter;
        bc.peer_addr = cfg.peer;
        return std::make_unique<transport::BluezChannel>(std::move(bc));
    }
    // default - simulated dispenser
    return std::make_unique<transport::LoopbackChannel>(cfg.transfer.ack_marker);
}

int main()
{
    pillbox::set_log_tag("pillboxd");
    const app::Config cfg = app::config_from_env();
    LOG_SYSTEM("Config: transport=%s adapter=%s peer=%s sock=%s", cfg.transport.c_str(),
               cfg.adapter.c_str(), cfg.peer ? cfg.peer->c_str() : "(none)",
               cfg.ctl_sock.c_str());

    auto ch = make_channel(cfg);

    app::DispenserService service(*ch, cfg.transfer);
    if (!service.start())
    {
        LOG_ERROR("DispenserService start failed");
        return 1;
    }
    app::ControlHandler control(service);

    const bool ok = ipc::start_server(cfg.ctl_sock, [&control](const std::string &line,
                                                               const ipc::Reply  &reply) {
        control.on_line(line, reply);
    });
    // start_server joined every worker, nothing else touches the service
    service.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}
