#pragma once
#include <functional>
#include <optional>
#include <string>

namespace ipc
{

// Reply text for one request line ("" closes without a reply).
using Handler = std::function<std::string(const std::string &line)>;

// One request per connection: reads the first line, writes the handler's reply,
// closes. Returns once a "QUIT" line has been answered.
bool start_server(const std::string &sock_path, const Handler &on_line);

// Sends line, then returns everything the server wrote back before closing;
// nullopt when the server is unreachable.
std::optional<std::string> send_line(const std::string &sock_path, const std::string &line);

}  // namespace ipc
