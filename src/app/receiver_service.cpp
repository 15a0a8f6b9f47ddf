#include <cstdio>
#include <string>

#include "app/receiver_service.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

static std::string mb_string(std::size_t bytes)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

static xfer::Options engine_options(const util::Config &cfg)
{
    xfer::Options o;
    o.scope              = cfg.hash_scope;
    o.max_transfer_bytes = cfg.max_transfer_bytes;
    o.strict             = cfg.strict;
    return o;
}

ReceiverService::ReceiverService(transport::ITransport &t, store::ISink &sink,
                                 const util::Config &cfg)
    : tx_(t), engine_(sink, engine_options(cfg)), scope_(cfg.hash_scope)
{
    engine_.set_listener([this](const xfer::Event &ev) { on_event(ev); });
}

bool ReceiverService::start()
{
    stop();

    transport::Settings s{};
    s.role        = (tx_.name() == "bluez") ? "central" : "loopback";
    s.svc_uuid    = std::string(constants::SVC_UUID);
    s.notify_uuid = std::string(constants::NOTIFY_UUID);
    s.mtu         = constants::DEFAULT_MTU;

    tx_.set_link_listener([this](bool up) { on_link(up); });
    if (!tx_.start(s, [this](const transport::Frame &f) { this->on_rx(f); }))
    {
        LOG_ERROR("transport '%s' failed to start", tx_.name().c_str());
        return false;
    }
    started_ = true;

    LOG_SYSTEM("[XFER] ready on %s (scope=%s)", tx_.name().c_str(),
               integrity::scope_name(scope_));
    return true;
}

void ReceiverService::stop()
{
    if (started_)
    {
        tx_.stop();
        tx_.set_link_listener(nullptr);
        started_ = false;
    }
}

void ReceiverService::on_rx(const transport::Frame &f)
{
    engine_.on_chunk(f);
}

void ReceiverService::abort()
{
    engine_.abort();
}

std::string ReceiverService::status() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

std::vector<store::FileHandle> ReceiverService::completed_files() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return files_;
}

void ReceiverService::on_event(const xfer::Event &ev)
{
    std::lock_guard<std::mutex> lk(mu_);
    switch (ev.kind)
    {
        case xfer::EventKind::Started:
            status_ = "receiving: " + mb_string(0);
            LOG_SYSTEM("[XFER] transfer started");
            break;
        case xfer::EventKind::Progress:
            status_ = "receiving: " + mb_string(ev.bytes);
            break;
        case xfer::EventKind::Completed:
            files_.push_back(ev.handle);
            status_ = "received: " + store::basename_of(ev.handle);
            LOG_SYSTEM("[XFER] received %s (%zu bytes)", ev.handle.c_str(), ev.bytes);
            break;
        case xfer::EventKind::Failed:
            status_ = std::string("error: ") + xfer::status_message(ev.error);
            LOG_SYSTEM("[XFER] failed: %s", xfer::error_name(ev.error));
            break;
    }
}

// Runs in the thread that saw the edge; a drop cancels before any later chunk is taken.
void ReceiverService::on_link(bool up)
{
    if (up)
    {
        LOG_SYSTEM("[XFER] link up");
        return;
    }
    LOG_SYSTEM("[XFER] link down");
    engine_.on_disconnect();
}

}  // namespace app
