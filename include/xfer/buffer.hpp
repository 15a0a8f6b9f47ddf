#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xfer
{

// Append-only accumulator for one transfer's payload bytes.
class Buffer
{
  public:
    void                      append(const std::uint8_t *data, std::size_t len);
    void                      append(const std::vector<std::uint8_t> &bytes);
    void                      clear();
    std::size_t               length() const { return bytes_.size(); }
    bool                      empty() const { return bytes_.empty(); }
    std::vector<std::uint8_t> snapshot() const { return bytes_; }
    // Move the bytes out, leaving the buffer empty.
    std::vector<std::uint8_t> take();

  private:
    std::vector<std::uint8_t> bytes_;
};

}  // namespace xfer
