#pragma once
#include <atomic>
#include <string>

#include "app/dispenser_service.hpp"
#include "ctl/ipc.hpp"

namespace app
{

// Line protocol of the control socket, one command per connection:
//   SEND <abs-path>   -> PROGRESS k/N ... then OK | FAIL <detail>
//   CANCEL            -> OK | FAIL no active transfer
//   STATUS            -> STATE <state> CONNECTED <0|1> TRANSPORT <name>
//   PEERS             -> PEER <addr> rssi=<n> name=<s> ... OK       (BLE only)
//   CONNECT <mac>     -> OK | FAIL ...                              (BLE only)
//   DISCONNECT        -> OK | FAIL ...                              (BLE only)
//   QUIT              -> OK, active and later transfers are refused/cancelled
// Called concurrently from the control-socket workers.
class ControlHandler
{
  public:
    explicit ControlHandler(DispenserService &svc) : svc_(svc) {}

    void on_line(const std::string &line, const ipc::Reply &reply);
    bool shutting_down() const { return quitting_.load(); }

  private:
    void handle_send(const std::string &arg, const ipc::Reply &reply);
    void handle_link(const std::string &line, const ipc::Reply &reply);

    DispenserService &svc_;
    std::atomic_bool  quitting_{false};
};

}  // namespace app
