#include <exception>
#include <optional>
#include <utility>

#include "crypto/digest.hpp"
#include "xfer/engine.hpp"
#include "util/log.hpp"

namespace xfer
{

const char *phase_name(Phase p)
{
    switch (p)
    {
        case Phase::Idle:
            return "idle";
        case Phase::Receiving:
            return "receiving";
        case Phase::Finalizing:
            return "finalizing";
        case Phase::Completed:
            return "completed";
        case Phase::Failed:
            return "failed";
    }
    return "?";
}

Engine::Engine(store::ISink &sink, Options opt) : sink_(sink), opt_(opt) {}

Phase Engine::phase() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_.phase;
}

std::size_t Engine::bytes_received() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return session_.bytes_received();
}

Error Engine::last_error() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_error_;
}

// ======================================================================
// Function: Engine::emit
// - In: ticket taken under mu_ together with the state change that
//       produced events
// - Out: events delivered once every earlier ticket has been delivered
// ======================================================================
void Engine::emit(std::uint64_t ticket, const std::vector<Event> &events)
{
    std::unique_lock<std::mutex> lk(emit_mu_);
    emit_cv_.wait(lk, [&] { return serving_ == ticket; });
    lk.unlock();

    if (listener_)
    {
        for (const auto &ev : events)
            listener_(ev);
    }

    lk.lock();
    ++serving_;
    lk.unlock();
    emit_cv_.notify_all();
}

void Engine::begin_locked(std::vector<Event> &out)
{
    // Completed/Failed go back to Idle before the new session starts
    if (session_.phase != Phase::Idle)
        LOG_DEBUG("reset %s -> idle", phase_name(session_.phase));
    session_.phase = Phase::Idle;
    session_.buffer.clear();
    last_error_     = Error::None;
    cancel_pending_ = false;

    session_.phase = Phase::Receiving;
    LOG_INFO("transfer started");
    out.push_back(Event{EventKind::Started});
}

void Engine::append_locked(const proto::Chunk &c, std::vector<Event> &out)
{
    const std::size_t cap = opt_.max_transfer_bytes;
    if (cap != 0 && session_.buffer.length() + c.size() > cap)
    {
        LOG_WARN("transfer exceeds limit (%zu + %zu > %zu bytes)", session_.buffer.length(),
                 c.size(), cap);
        fail_locked(Error::Oversize, out);
        return;
    }
    session_.buffer.append(c);
    out.push_back(Event{EventKind::Progress, session_.buffer.length()});
}

void Engine::fail_locked(Error e, std::vector<Event> &out)
{
    session_.buffer.clear();
    session_.phase = Phase::Failed;
    last_error_    = e;
    LOG_WARN("transfer failed: %s", error_name(e));
    Event ev{EventKind::Failed};
    ev.error = e;
    out.push_back(std::move(ev));
}

void Engine::on_chunk(const proto::Chunk &c)
{
    std::vector<Event> out;
    std::uint64_t      ticket = 0;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (c.empty())
        {
            LOG_DEBUG("dropping empty chunk");
            return;
        }

        const Phase       ph   = session_.phase;
        const proto::Kind kind = proto::classify(c, ph == Phase::Receiving);
        LOG_DEBUG("chunk len=%zu kind=%s phase=%s", c.size(), proto::kind_name(kind),
                  phase_name(ph));

        if (ph == Phase::Finalizing)
        {
            LOG_DEBUG("finalizing, ignoring chunk (len=%zu)", c.size());
            return;
        }

        if (ph != Phase::Receiving)
        {
            if (kind == proto::Kind::Start)
            {
                begin_locked(out);
            }
            else if (opt_.strict && c.back() == proto::END_MARKER)
            {
                LOG_WARN("end marker while %s", phase_name(ph));
                last_error_ = Error::ProtocolViolation;
                Event ev{EventKind::Failed};
                ev.error = Error::ProtocolViolation;
                out.push_back(std::move(ev));
            }
            else
            {
                LOG_DEBUG("not receiving, ignoring %s chunk", proto::kind_name(kind));
            }
        }
        else if (kind == proto::Kind::Payload)
        {
            // includes a repeated start marker: never resets the session
            append_locked(c, out);
        }
        else  // End
        {
            session_.phase                    = Phase::Finalizing;
            std::vector<std::uint8_t> content = session_.buffer.take();
            LOG_INFO("end marker, finalizing %zu bytes", content.size());

            // persistence may block: run it without the lock, Finalizing keeps
            // other chunks out of the buffer
            lk.unlock();
            Outcome res = finalize(content);
            lk.lock();

            if (cancel_pending_)
            {
                cancel_pending_ = false;
                if (res.err == Error::None && !sink_.remove(res.handle))
                    LOG_WARN("cancelled, could not remove %s", res.handle.c_str());
                res.err = Error::Cancelled;
            }

            if (res.err == Error::None)
            {
                session_.phase = Phase::Completed;
                last_error_    = Error::None;
                LOG_INFO("transfer completed: %s (%zu bytes)", res.handle.c_str(),
                         content.size());
                Event ev{EventKind::Completed};
                ev.bytes  = content.size();
                ev.handle = std::move(res.handle);
                out.push_back(std::move(ev));
            }
            else
            {
                fail_locked(res.err, out);
            }
        }
        if (out.empty())
            return;
        ticket = next_ticket_++;
    }
    emit(ticket, out);
}

Engine::Outcome Engine::finalize(const std::vector<std::uint8_t> &content)
{
    Outcome                          res;
    std::optional<store::FileHandle> written;
    try
    {
        written = sink_.write(content);
        if (!written)
        {
            res.err = Error::IoError;
            return res;
        }

        // verify what actually landed in storage
        auto stored = sink_.read(*written);
        if (!stored)
        {
            res.err = Error::IoError;
        }
        else
        {
            res.err = integrity::verify(*stored, opt_.scope);
        }
    }
    catch (const std::exception &ex)
    {
        LOG_ERROR("finalize: %s", ex.what());
        res.err = Error::IoError;
    }

    if (res.err != Error::None)
    {
        // a failed transfer never stays on disk
        if (written && !sink_.remove(*written))
            LOG_WARN("could not remove rejected file %s", written->c_str());
        return res;
    }
    res.handle = std::move(*written);
    return res;
}

void Engine::cancel(const char *why)
{
    std::vector<Event> out;
    std::uint64_t      ticket = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        switch (session_.phase)
        {
            case Phase::Receiving:
                LOG_INFO("%s while receiving %zu bytes", why, session_.buffer.length());
                fail_locked(Error::Cancelled, out);
                break;
            case Phase::Finalizing:
                LOG_INFO("%s while finalizing", why);
                cancel_pending_ = true;
                break;
            default:
                LOG_DEBUG("%s while %s, nothing to cancel", why, phase_name(session_.phase));
                break;
        }
        if (out.empty())
            return;
        ticket = next_ticket_++;
    }
    emit(ticket, out);
}

void Engine::on_disconnect()
{
    cancel("link down");
}

void Engine::abort()
{
    cancel("abort");
}

}  // namespace xfer
