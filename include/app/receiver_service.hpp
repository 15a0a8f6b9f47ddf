#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "store/sink.hpp"
#include "transport/itransport.hpp"
#include "util/config.hpp"
#include "xfer/engine.hpp"

namespace app
{

// Transport -> engine wiring plus the state a control client can query.
class ReceiverService
{
  public:
    ReceiverService(transport::ITransport &t, store::ISink &sink, const util::Config &cfg);
    ~ReceiverService() { stop(); }

    bool start();
    void stop();
    void on_rx(const transport::Frame &f);
    void abort();

    // "ready", "receiving: 0.25 MB", "received: <name>", "error: <msg>"
    std::string                    status() const;
    std::vector<store::FileHandle> completed_files() const;
    std::vector<transport::PeerInfo> peers() const { return tx_.list_peers(); }

    const xfer::Engine &engine() const { return engine_; }

  private:
    void on_event(const xfer::Event &ev);
    void on_link(bool up);

    transport::ITransport &tx_;
    xfer::Engine           engine_;
    integrity::Scope       scope_;
    bool                   started_{false};

    mutable std::mutex             mu_;  // status_ and files_
    std::string                    status_{"ready"};
    std::vector<store::FileHandle> files_;
};

}  // namespace app
