#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace store
{

// Absolute path of a persisted file.
using FileHandle = std::string;

struct ISink
{
    // Durably store `content`; a new, unique handle per call.
    virtual std::optional<FileHandle> write(const std::vector<std::uint8_t> &content) = 0;
    virtual std::optional<std::vector<std::uint8_t>> read(const FileHandle &h)        = 0;
    virtual bool                                     remove(const FileHandle &h)      = 0;
    virtual ~ISink() = default;
};

// Writes received_file_<epoch-ms>.bin files into one directory.
class FsSink final : public ISink
{
  public:
    explicit FsSink(std::string dir);

    std::optional<FileHandle>                write(const std::vector<std::uint8_t> &content) override;
    std::optional<std::vector<std::uint8_t>> read(const FileHandle &h) override;
    bool                                     remove(const FileHandle &h) override;

    const std::string &dir() const { return dir_; }

  private:
    bool ensure_dir();

    std::string dir_;
};

std::string basename_of(const FileHandle &h);

}  // namespace store
