#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <list>
#include <memory>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace
{
namespace fs = std::filesystem;

constexpr std::chrono::milliseconds FIRST_LINE_TIMEOUT{5000};

// Creates the socket directory (0700) if it is missing.
bool make_sock_dir(const std::string &sock_path)
{
    const fs::path dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    if (!fs::create_directories(dir, ec) && ec)
    {
        LOG_ERROR("cannot create %s: %s", dir.c_str(), ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("chmod 0700 %s: %s", dir.c_str(), ec.message().c_str());
    return true;
}

int unix_socket()
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        LOG_ERROR("socket(AF_UNIX): %s", std::strerror(errno));
    return fd;
}

bool to_sockaddr(const std::string &sock_path, sockaddr_un &sa, socklen_t &len)
{
    sa = sockaddr_un{};
    if (sock_path.empty() || sock_path.size() >= sizeof(sa.sun_path))
    {
        errno = sock_path.empty() ? EINVAL : ENAMETOOLONG;
        LOG_ERROR("unusable control socket path '%s'", sock_path.c_str());
        return false;
    }
    sa.sun_family = AF_UNIX;
    std::memcpy(sa.sun_path, sock_path.data(), sock_path.size());
    len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

// close() that keeps the errno of the failure being reported
void close_keep_errno(int fd)
{
    const int saved = errno;
    ::close(fd);
    errno = saved;
}

bool send_all(int fd, const std::string &data)
{
    std::size_t off = 0;
    while (off < data.size())
    {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// First line of a connection, without "\r\n". false on a recv error.
bool recv_line(int fd, std::string &line)
{
    std::string acc;
    char        chunk[256];
    std::size_t nl;
    while ((nl = acc.find('\n')) == std::string::npos)
    {
        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            LOG_WARN("control client sent no command line, dropping it");
            return false;
        }
        if (n < 0)
        {
            LOG_ERROR("recv on control connection: %s", std::strerror(errno));
            return false;
        }
        if (n == 0)
            break;  // client closed without a newline
        acc.append(chunk, static_cast<std::size_t>(n));
    }
    line = acc.substr(0, nl);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

// ======================================================================
// Function: open_listener
// - In: socket path
// - Out: listening fd, or -1 (logged)
// - Note: a leftover socket file from a crashed daemon is replaced
// ======================================================================
int open_listener(const std::string &sock_path)
{
    sockaddr_un sa{};
    socklen_t   len = 0;
    if (!to_sockaddr(sock_path, sa, len) || !make_sock_dir(sock_path))
        return -1;

    (void)::unlink(sock_path.c_str());
    int fd = unix_socket();
    if (fd == -1)
        return -1;
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&sa), len) == -1)
    {
        LOG_ERROR("bind(%s): %s", sock_path.c_str(), std::strerror(errno));
        close_keep_errno(fd);
        return -1;
    }
    if (::listen(fd, 8) == -1)
    {
        LOG_ERROR("listen(%s): %s", sock_path.c_str(), std::strerror(errno));
        close_keep_errno(fd);
        (void)::unlink(sock_path.c_str());
        return -1;
    }
    return fd;
}

int dial(const std::string &sock_path)
{
    sockaddr_un sa{};
    socklen_t   len = 0;
    if (!to_sockaddr(sock_path, sa, len))
        return -1;
    int fd = unix_socket();
    if (fd == -1)
        return -1;
    if (::connect(fd, reinterpret_cast<const sockaddr *>(&sa), len) == -1)
    {
        LOG_DEBUG("connect(%s): %s", sock_path.c_str(), std::strerror(errno));
        close_keep_errno(fd);
        return -1;
    }
    return fd;
}

// Dial and send one newline-terminated line; -1 on failure.
int dial_and_send(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("refusing to send an empty control line");
        return -1;
    }
    int fd = dial(sock_path);
    if (fd == -1)
        return -1;

    const std::string out = line.back() == '\n' ? line : line + "\n";
    LOG_DEBUG("-> %s", line.c_str());
    if (!send_all(fd, out))
    {
        LOG_ERROR("send on control socket: %s", std::strerror(errno));
        close_keep_errno(fd);
        return -1;
    }
    return fd;
}

Reply reply_writer(int fd)
{
    return [fd](const std::string &l) { return send_all(fd, l + "\n"); };
}

struct Worker
{
    std::thread                       th;
    std::shared_ptr<std::atomic_bool> done = std::make_shared<std::atomic_bool>(false);
};

void join_workers(std::list<Worker> &workers, bool finished_only)
{
    for (auto it = workers.begin(); it != workers.end();)
    {
        if (finished_only && !it->done->load())
        {
            ++it;
            continue;
        }
        if (it->th.joinable())
            it->th.join();
        it = workers.erase(it);
    }
}

// A client that connects and never finishes its line is dropped after this.
void set_first_line_timeout(int fd, std::chrono::milliseconds wait)
{
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(wait.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((wait.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
        LOG_WARN("SO_RCVTIMEO on control connection: %s", std::strerror(errno));
}
}  // namespace

// ======================================================================
// Function: start_server
// - In: socket path, per-connection line handler (may be empty)
// - Out: true after a clean QUIT; false if the socket cannot be served
// - Note: blocks the calling thread; socket file removed on return.
//         The accept thread never reads, so a slow client cannot hold
//         up the others. QUIT wakes accept4 via shutdown(SHUT_RD).
// ======================================================================
bool start_server(const std::string &sock_path, OnLine on_line)
{
    const int lfd = open_listener(sock_path);
    if (lfd == -1)
        return false;
    LOG_DEBUG("Listening on %s", sock_path.c_str());

    auto              quitting = std::make_shared<std::atomic_bool>(false);
    std::list<Worker> workers;
    bool              ok = true;
    for (;;)
    {
        const int cfd = ::accept4(lfd, nullptr, nullptr, SOCK_CLOEXEC);
        if (quitting->load())
        {
            if (cfd != -1)
                ::close(cfd);
            break;
        }
        if (cfd == -1 && errno == EINTR)
            continue;
        if (cfd == -1)
        {
            LOG_ERROR("accept on %s: %s", sock_path.c_str(), std::strerror(errno));
            ok = false;
            break;
        }
        join_workers(workers, true);
        set_first_line_timeout(cfd, FIRST_LINE_TIMEOUT);

        Worker w;
        w.th = std::thread([cfd, lfd, on_line, quitting, done = w.done] {
            std::string line;
            if (!recv_line(cfd, line))
            {
                ::close(cfd);  // one bad client does not stop the daemon
                done->store(true);
                return;
            }
            const bool quit = line == "QUIT";
            if (quit)
                quitting->store(true);
            if (on_line)
                on_line(line, reply_writer(cfd));
            ::close(cfd);
            if (quit)
                (void)::shutdown(lfd, SHUT_RD);
            done->store(true);
        });
        workers.push_back(std::move(w));
    }

    join_workers(workers, false);
    ::close(lfd);
    (void)::unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    const int fd = dial_and_send(sock_path, line);
    if (fd == -1)
        return false;
    ::close(fd);
    return true;
}

// ======================================================================
// Function: request
// - In: one command line (newline appended if missing)
// - Out: every reply line passed to on_reply in order; true once the
//        server closes the connection
// ======================================================================
bool request(const std::string &sock_path, const std::string &line, const OnReplyLine &on_reply)
{
    const int fd = dial_and_send(sock_path, line);
    if (fd == -1)
        return false;
    (void)::shutdown(fd, SHUT_WR);

    std::string pending;
    char        chunk[512];
    bool        ok = true;
    for (;;)
    {
        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0)
        {
            LOG_ERROR("recv reply: %s", std::strerror(errno));
            ok = false;
            break;
        }
        if (n == 0)
            break;
        pending.append(chunk, static_cast<std::size_t>(n));
        for (std::size_t nl; (nl = pending.find('\n')) != std::string::npos;)
        {
            const std::string reply = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (on_reply)
                on_reply(reply);
        }
    }
    if (ok && !pending.empty() && on_reply)
        on_reply(pending);
    ::close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // only "~" and "~/..." are expanded, "~user" is left alone
    if (p.empty() || p[0] != '~' || (p.size() > 1 && p[1] != '/'))
        return p;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
