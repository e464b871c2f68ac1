#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Writes one reply line back to the client; false once the client is gone.
using Reply = std::function<bool(const std::string &line)>;
// Called once per connection with its first line. Replies may be streamed
// until the handler returns, then the connection is closed.
using OnLine = std::function<void(const std::string &line, const Reply &reply)>;
using OnReplyLine = std::function<void(const std::string &line)>;

// Serve the control socket until a "QUIT" line arrives. Each connection is
// read and handled on its own worker thread; a client that sends no line
// within a few seconds is dropped. Every worker is joined before returning.
bool start_server(const std::string &sock_path, OnLine on_line);

// Fire-and-forget: send one line, do not wait for replies.
bool send_line(const std::string &sock_path, const std::string &line);

// Send one line and hand each reply line to on_reply until the server closes.
// false when the daemon is unreachable (errno kept from connect()).
bool request(const std::string &sock_path, const std::string &line, const OnReplyLine &on_reply);

std::string expand_user(const std::string &path);

}  // namespace ipc
