#include <utility>

#include "xfer/buffer.hpp"

namespace xfer
{

void Buffer::append(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return;
    bytes_.insert(bytes_.end(), data, data + len);
}

void Buffer::append(const std::vector<std::uint8_t> &bytes)
{
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

void Buffer::clear()
{
    bytes_.clear();
    bytes_.shrink_to_fit();
}

std::vector<std::uint8_t> Buffer::take()
{
    std::vector<std::uint8_t> out;
    out.swap(bytes_);
    return out;
}

}  // namespace xfer
