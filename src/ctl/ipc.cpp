#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

// Closes the descriptor on scope exit, keeping errno intact.
struct Fd
{
    int fd = -1;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd &)            = delete;
    Fd &operator=(const Fd &) = delete;
    ~Fd()
    {
        if (fd != -1)
        {
            const int saved = errno;
            ::close(fd);
            errno = saved;
        }
    }
};

bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    const fs::path  dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    // 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, sock_path.c_str(), sock_path.size() + 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

int unix_socket()
{
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
    return fd;
}

// Reads until the first '\n' or EOF. Returns the line without "\n" / "\r\n".
bool read_first_line(int fd, std::string &line)
{
    char buf[256];
    line.clear();
    while (line.find('\n') == std::string::npos)
    {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    const auto pos = line.find('\n');
    if (pos != std::string::npos)
        line.resize(pos);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

bool write_all(int fd, const std::string &data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

bool read_to_eof(int fd, std::string &out)
{
    char buf[512];
    while (true)
    {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            return true;
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
}

}  // namespace

// ======================================================================
// Function: start_server
// - In: socket path, handler producing the reply for each request line
// - Out: true after a clean QUIT; false when the socket cannot be served
// ======================================================================
bool start_server(const std::string &sock_path, const Handler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len) || !ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    Fd listener(unix_socket());
    if (listener.fd == -1)
        return false;
    if (::bind(listener.fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (::listen(listener.fd, 4) == -1)
    {
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        (void)::unlink(sock_path.c_str());
        return false;
    }
    LOG_DEBUG("Listening on %s", sock_path.c_str());

    bool quit = false;
    while (!quit)
    {
        Fd conn(::accept4(listener.fd, nullptr, nullptr, SOCK_CLOEXEC));
        if (conn.fd == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            (void)::unlink(sock_path.c_str());
            return false;
        }

        std::string line;
        if (!read_first_line(conn.fd, line))
            continue;  // drop this client, keep serving

        const std::string reply = on_line ? on_line(line) : std::string{};
        if (!reply.empty() && !write_all(conn.fd, reply))
            LOG_WARN("reply to '%s' not delivered", line.c_str());

        quit = (line == "QUIT");
    }

    (void)::unlink(sock_path.c_str());
    return true;
}

// ======================================================================
// Function: send_line
// - In: socket path, one request line (newline appended when missing)
// - Out: the reply, possibly empty; nullopt when no server answered
// ======================================================================
std::optional<std::string> send_line(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return std::nullopt;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return std::nullopt;

    Fd fd(unix_socket());
    if (fd.fd == -1)
        return std::nullopt;
    if (::connect(fd.fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return std::nullopt;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    if (!write_all(fd.fd, out))
        return std::nullopt;
    // half-close: the server sees EOF even if it reads past the line
    (void)::shutdown(fd.fd, SHUT_WR);

    std::string reply;
    if (!read_to_eof(fd.fd, reply))
        return std::nullopt;
    return reply;
}

}  // namespace ipc
