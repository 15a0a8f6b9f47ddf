// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <mutex>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_to_send;

// Canned daemon replies
static std::string on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines_to_send.push_back(line);
    if (line == "STATUS")
        return "receiving: 0.25 MB\n";
    if (line == "FILES")
        return "/tmp/out/received_file_1700000000000.bin\n"
               "/tmp/out/received_file_1700000000500.bin\n";
    if (line == "PEERS")
        return "AA:BB:CC:DD:EE:01 rssi=-52 name=sender svc\n";
    if (line == "DISCONNECT")
        return "ERR not supported on this transport\n";
    return "ok\n";
}

static std::string temp_sock_path()
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/filerx-cli-test-" + std::to_string(::getpid()) + ".sock";
}

static std::string out_path()
{
    return temp_sock_path() + ".out";
}

static std::string read_out()
{
    std::ifstream      ifs(out_path());
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// stdout goes to out_path(), read it back with read_out()
static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd =
        "./bin/filerxctl --sock " + sock + " " + args + " >" + out_path() + " 2>/dev/null";
    int rc = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionality)
{
    test_cli::g_lines_to_send.clear();
    const auto sock = test_cli::temp_sock_path();

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC, and the replies printed on stdout
    EXPECT_EQ(test_cli::run_cli(sock, "status"), exitc::ok);
    EXPECT_EQ(test_cli::read_out(), "receiving: 0.25 MB\n");
    EXPECT_EQ(test_cli::run_cli(sock, "files"), exitc::ok);
    EXPECT_EQ(test_cli::read_out(), "/tmp/out/received_file_1700000000000.bin\n"
                                    "/tmp/out/received_file_1700000000500.bin\n");
    EXPECT_EQ(test_cli::run_cli(sock, "peers"), exitc::ok);
    EXPECT_EQ(test_cli::read_out(), "AA:BB:CC:DD:EE:01 rssi=-52 name=sender svc\n");
    EXPECT_EQ(test_cli::run_cli(sock, "abort"), exitc::ok);
    EXPECT_EQ(test_cli::read_out(), "ok\n");
    EXPECT_EQ(test_cli::run_cli(sock, "connect aa:bb:cc:dd:ee:ff"), exitc::ok);
    // the daemon rejected it: nothing on stdout, failure exit code
    EXPECT_EQ(test_cli::run_cli(sock, "disconnect"), exitc::failure);
    EXPECT_EQ(test_cli::read_out(), "");
    // rejected locally, never reach the daemon
    EXPECT_EQ(test_cli::run_cli(sock, "connect nonsense"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "connect"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "bogus"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_to_send.size(), 7u);
        EXPECT_EQ(test_cli::g_lines_to_send[0], "STATUS");
        EXPECT_EQ(test_cli::g_lines_to_send[1], "FILES");
        EXPECT_EQ(test_cli::g_lines_to_send[2], "PEERS");
        EXPECT_EQ(test_cli::g_lines_to_send[3], "ABORT");
        EXPECT_EQ(test_cli::g_lines_to_send[4], "CONNECT AA:BB:CC:DD:EE:FF");
        EXPECT_EQ(test_cli::g_lines_to_send[5], "DISCONNECT");
        EXPECT_EQ(test_cli::g_lines_to_send.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
    ::unlink(test_cli::out_path().c_str());
}

TEST(CLI, NoDaemon)
{
    const auto sock = test_cli::temp_sock_path() + ".absent";
    EXPECT_EQ(test_cli::run_cli(sock, "status"), exitc::no_server);
}
