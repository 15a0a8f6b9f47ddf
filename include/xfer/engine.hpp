#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "crypto/digest.hpp"
#include "proto/classify.hpp"
#include "store/sink.hpp"
#include "xfer/buffer.hpp"
#include "xfer/errors.hpp"

/*
RX:
transport notification (one chunk)
  -> Engine::on_chunk
       -> proto::classify(chunk, phase == Receiving)
            Start   : Idle/Completed/Failed -> Receiving (buffer cleared)
            Payload : Receiving -> Receiving (buffer.append, Progress)
            End     : Receiving -> Finalizing
                        -> sink.write -> sink.read -> integrity::verify
                        -> Completed(handle) | Failed(error)
link down / abort
  -> Engine::on_disconnect / abort -> Failed(Cancelled)
*/

namespace xfer
{

enum class Phase
{
    Idle,
    Receiving,
    Finalizing,
    Completed,
    Failed
};

const char *phase_name(Phase p);

struct Session
{
    Phase       phase = Phase::Idle;
    Buffer      buffer;
    std::size_t bytes_received() const { return buffer.length(); }
};

enum class EventKind
{
    Started,
    Progress,
    Completed,
    Failed
};

struct Event
{
    EventKind         kind;
    std::size_t       bytes = 0;  // Progress
    store::FileHandle handle;     // Completed
    Error             error = Error::None;  // Failed
};

using OnEvent = std::function<void(const Event &)>;

struct Options
{
    integrity::Scope scope              = integrity::Scope::FullContent;
    std::size_t      max_transfer_bytes = 0;      // 0 = unbounded
    bool             strict             = false;  // report stray end markers
};

class Engine
{
  public:
    explicit Engine(store::ISink &sink, Options opt = {});

    // Listener is invoked without the engine lock held, in the calling thread.
    // Events reach it in the order the state changes happened, one batch at a
    // time, even when chunks and cancellation arrive on different threads.
    // It may query the engine but must not feed or cancel it.
    void set_listener(OnEvent cb) { listener_ = std::move(cb); }

    void on_chunk(const proto::Chunk &c);
    void on_disconnect();
    void abort();

    Phase       phase() const;
    std::size_t bytes_received() const;
    Error       last_error() const;

  private:
    struct Outcome
    {
        Error             err = Error::None;
        store::FileHandle handle;
    };

    void    begin_locked(std::vector<Event> &out);
    void    append_locked(const proto::Chunk &c, std::vector<Event> &out);
    void    fail_locked(Error e, std::vector<Event> &out);
    void    cancel(const char *why);
    Outcome finalize(const std::vector<std::uint8_t> &content);
    void    emit(std::uint64_t ticket, const std::vector<Event> &events);

    store::ISink      &sink_;
    Options            opt_;
    OnEvent            listener_;
    mutable std::mutex mu_;
    Session            session_;
    Error              last_error_{Error::None};
    bool               cancel_pending_{false};  // abort seen while Finalizing
    std::uint64_t      next_ticket_{0};          // guarded by mu_

    // delivery order: batch N is delivered after batch N-1
    std::mutex              emit_mu_;
    std::condition_variable emit_cv_;
    std::uint64_t           serving_{0};
};

}  // namespace xfer
