#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "store/sink.hpp"

// In-memory sink for engine/service tests; records every write and removal.
struct MemSink : store::ISink
{
    bool fail_write = false;
    bool fail_read  = false;

    std::map<store::FileHandle, std::vector<std::uint8_t>> files;
    std::vector<std::vector<std::uint8_t>>                 written;  // every write, in order
    std::vector<store::FileHandle>                         removed;

    std::optional<store::FileHandle> write(const std::vector<std::uint8_t> &content) override
    {
        if (fail_write)
            return std::nullopt;
        written.push_back(content);
        store::FileHandle h = "mem-" + std::to_string(written.size());
        files[h]            = content;
        return h;
    }

    std::optional<std::vector<std::uint8_t>> read(const store::FileHandle &h) override
    {
        if (fail_read)
            return std::nullopt;
        auto it = files.find(h);
        if (it == files.end())
            return std::nullopt;
        return it->second;
    }

    bool remove(const store::FileHandle &h) override
    {
        removed.push_back(h);
        return files.erase(h) == 1;
    }
};

inline std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
