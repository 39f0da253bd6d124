#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
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

// Owns one descriptor, closes it on scope exit (errno preserved).
class UniqueFd
{
  public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd &)            = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    int  get() const { return fd_; }
    bool valid() const { return fd_ != -1; }
    void reset()
    {
        if (fd_ != -1)
        {
            int saved = errno;
            ::close(fd_);
            errno = saved;
            fd_   = -1;
        }
    }

  private:
    int fd_;
};

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Fill a sockaddr_un for `path`; false (errno set) if the path cannot fit.
static bool make_addr(const std::string &path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + path.size() + 1);
    return true;
}

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(), ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

// Read up to the first '\n' (or EOF). False on error or when the line exceeds MAX_LINE.
static bool read_first_line(int fd, std::string &out)
{
    out.clear();
    char buf[256];
    while (true)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            auto nl = out.find('\n');
            if (nl != std::string::npos)
            {
                out.resize(nl);
                break;
            }
            if (out.size() > MAX_LINE)
            {
                LOG_WARN("command line longer than %zu bytes dropped", MAX_LINE);
                return false;
            }
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    if (out.size() > MAX_LINE)
    {
        LOG_WARN("command line longer than %zu bytes dropped", MAX_LINE);
        return false;
    }
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

}  // namespace

bool is_quit(const std::string &line)
{
    auto l = line.find_first_not_of(" \t\r\n");
    auto r = line.find_last_not_of(" \t\r\n");
    if (l == std::string::npos || r - l + 1 != 4)
        return false;
    static const char want[] = "QUIT";
    for (size_t i = 0; i < 4; ++i)
    {
        if (std::toupper(static_cast<unsigned char>(line[l + i])) != want[i])
            return false;
    }
    return true;
}

bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    UniqueFd lfd(socket(AF_UNIX, SOCK_STREAM, 0));
    if (!lfd.valid())
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(lfd.get());

    if (bind(lfd.get(), reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        LOG_ERROR("bind(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }
    if (listen(lfd.get(), 8) == -1)
    {
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        unlink(sock_path.c_str());
        return false;
    }
    LOG_INFO("Listening on %s", sock_path.c_str());

    bool ok = true;
    while (true)
    {
        int cfd = accept(lfd.get(), nullptr, nullptr);
        if (cfd == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        UniqueFd conn(cfd);
        set_cloexec(conn.get());

        std::string line;
        if (!read_first_line(conn.get(), line))
            continue;  // keep serving
        conn.reset();

        if (on_line)
            on_line(line);
        if (is_quit(line))
            break;
    }

    lfd.reset();
    unlink(sock_path.c_str());
    LOG_DEBUG("Server on %s closed", sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Refusing to send an empty line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    UniqueFd fd(socket(AF_UNIX, SOCK_STREAM, 0));
    if (!fd.valid())
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd.get());

    if (connect(fd.get(), reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        LOG_ERROR("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    LOG_DEBUG("Sending line: %.*s", (int)(out.size() - 1), out.c_str());

    size_t sent = 0;
    while (sent < out.size())
    {
        ssize_t n = send(fd.get(), out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
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

std::string expand_user(const std::string &p)
{
    if (p.empty() || p[0] != '~' || (p.size() > 1 && p[1] != '/'))
        return p;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
