#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include "store/sink.hpp"
#include "util/log.hpp"

namespace store
{
namespace fs = std::filesystem;

static constexpr int MAX_NAME_TRIES = 1000;

FsSink::FsSink(std::string dir) : dir_(std::move(dir)) {}

std::string basename_of(const FileHandle &h)
{
    auto pos = h.find_last_of('/');
    return pos == std::string::npos ? h : h.substr(pos + 1);
}

bool FsSink::ensure_dir()
{
    std::error_code ec;
    if (dir_.empty())
    {
        LOG_ERROR("output directory not set");
        return false;
    }
    if (fs::is_directory(dir_, ec))
        return true;
    if (!fs::create_directories(dir_, ec) && ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

static bool write_all(int fd, const std::uint8_t *data, std::size_t len)
{
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n > 0)
        {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

std::optional<FileHandle> FsSink::write(const std::vector<std::uint8_t> &content)
{
    if (!ensure_dir())
        return std::nullopt;

    using namespace std::chrono;
    const long long ms =
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const std::string stem = dir_ + "/received_file_" + std::to_string(ms);

    // O_EXCL so two transfers within the same millisecond never share a file
    std::string path;
    int         fd = -1;
    for (int i = 0; i < MAX_NAME_TRIES && fd < 0; ++i)
    {
        path = (i == 0) ? stem + ".bin" : stem + "_" + std::to_string(i) + ".bin";
        fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0 && errno != EEXIST)
        {
            LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
            return std::nullopt;
        }
    }
    if (fd < 0)
    {
        LOG_ERROR("no free file name for %s", stem.c_str());
        return std::nullopt;
    }

    if (!write_all(fd, content.data(), content.size()) || ::fsync(fd) != 0)
    {
        int saved = errno;
        ::close(fd);
        ::unlink(path.c_str());
        LOG_ERROR("write(%s) failed: %s", path.c_str(), std::strerror(saved));
        return std::nullopt;
    }
    if (::close(fd) != 0)
    {
        int saved = errno;
        ::unlink(path.c_str());
        LOG_ERROR("close(%s) failed: %s", path.c_str(), std::strerror(saved));
        return std::nullopt;
    }

    LOG_DEBUG("wrote %zu bytes to %s", content.size(), path.c_str());
    return path;
}

std::optional<std::vector<std::uint8_t>> FsSink::read(const FileHandle &h)
{
    int fd = ::open(h.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        LOG_ERROR("open(%s) failed: %s", h.c_str(), std::strerror(errno));
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    struct stat               st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0)
        out.reserve(static_cast<std::size_t>(st.st_size));

    std::uint8_t buf[4096];
    while (true)
    {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            out.insert(out.end(), buf, buf + n);
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        int saved = errno;
        ::close(fd);
        LOG_ERROR("read(%s) failed: %s", h.c_str(), std::strerror(saved));
        return std::nullopt;
    }
    ::close(fd);
    return out;
}

bool FsSink::remove(const FileHandle &h)
{
    if (::unlink(h.c_str()) != 0)
    {
        LOG_WARN("unlink(%s) failed: %s", h.c_str(), std::strerror(errno));
        return false;
    }
    return true;
}

}  // namespace store
