#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  filerxctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  status\n"
                         "  files\n"
                         "  peers\n"
                         "  abort\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    const auto reply = ipc::send_line(sock, line + "\n");
    if (!reply)
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    // "ERR <reason>" is a rejected command; anything else is the answer
    if (reply->rfind("ERR ", 0) == 0)
    {
        std::fprintf(stderr, "error: %s", reply->c_str() + 4);
        return exitc::failure;
    }
    std::fputs(reply->c_str(), stdout);
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"files", [&]() -> int { return send_line("FILES"); }},
        {"peers", [&]() -> int { return send_line("PEERS"); }},
        {"abort", [&]() -> int { return send_line("ABORT"); }},
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string mac = util::normalize_mac(args[1]);
             if (!util::is_valid_mac(mac))
             {
                 std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("CONNECT " + mac);
         }},
        {"disconnect", [&]() -> int { return send_line("DISCONNECT"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // parse options (only --sock)
    // FILERX_CTL_SOCK or the default path, then CLI --sock overrides
    std::string sock = util::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = util::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    int rc = run_cmd(cmd, args, sender);
    return rc;
}
