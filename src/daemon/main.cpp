#include <memory>
#include <string>

#include "app/receiver_service.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "store/sink.hpp"
#include "transport/bluez_transport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

static std::unique_ptr<transport::ITransport> make_transport(const util::Config &cfg)
{
    if (cfg.transport == "bluez")
    {
        transport::BluezConfig bc;
        bc.adapter   = cfg.adapter;
        bc.peer_addr = cfg.peer_addr;
        return std::make_unique<transport::BluezTransport>(std::move(bc));
    }
    // default - loopback
    return std::make_unique<transport::LoopbackTransport>();
}

int main()
{
    const util::Config cfg = util::load_config();
    LOG_SYSTEM("Config: transport=%s adapter=%s peer=%s out=%s scope=%s max=%zu strict=%d",
               cfg.transport.c_str(), cfg.adapter.c_str(),
               cfg.peer_addr ? cfg.peer_addr->c_str() : "(none)", cfg.out_dir.c_str(),
               integrity::scope_name(cfg.hash_scope), cfg.max_transfer_bytes, cfg.strict ? 1 : 0);

    auto tx = make_transport(cfg);

    store::FsSink sink(cfg.out_dir);

    app::ReceiverService rx(*tx, sink, cfg);
    if (!rx.start())
    {
        LOG_ERROR("ReceiverService start failed");
        return exitc::failure;
    }

    const ctl::Context ctx{&rx, tx.get()};
    const bool         ok = ipc::start_server(
        cfg.ctl_sock, [&ctx](const std::string &line) { return ctl::handle_command(line, ctx); });
    rx.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return exitc::failure;
    }
    return exitc::ok;
}
