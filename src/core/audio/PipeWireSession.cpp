#include "PipeWireSession.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>

namespace mos {

static int lastError(int fallback)
{
    return errno > 0 ? -errno : fallback;
}

PipeWireSession::PipeWireSession()
{
    pw_init(nullptr, nullptr);

    threadLoop_ = pw_thread_loop_new("multi-output", nullptr);
    if (!threadLoop_) {
        connectError_ = lastError(-ENOMEM);
        BOOST_LOG_TRIVIAL(warning) << "PipeWireSession: failed to create thread loop";
        return;
    }

    pw_thread_loop_lock(threadLoop_);

    context_ = pw_context_new(pw_thread_loop_get_loop(threadLoop_), nullptr, 0);
    if (!context_) {
        connectError_ = lastError(-ENOMEM);
        BOOST_LOG_TRIVIAL(warning) << "PipeWireSession: failed to create context";
        pw_thread_loop_unlock(threadLoop_);
        pw_thread_loop_destroy(threadLoop_);
        threadLoop_ = nullptr;
        return;
    }

    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        connectError_ = lastError(-ECONNREFUSED);
        BOOST_LOG_TRIVIAL(warning) << "PipeWireSession: failed to connect to PipeWire daemon";
        pw_thread_loop_unlock(threadLoop_);
        pw_context_destroy(context_);
        context_ = nullptr;
        pw_thread_loop_destroy(threadLoop_);
        threadLoop_ = nullptr;
        return;
    }

    static const struct pw_core_events coreEvents = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = onCoreDone,
        .error = onCoreError,
    };
    spa_zero(coreListener_);
    pw_core_add_listener(core_, &coreListener_, &coreEvents, this);

    pw_thread_loop_unlock(threadLoop_);

    if (pw_thread_loop_start(threadLoop_) < 0) {
        connectError_ = -EIO;
        BOOST_LOG_TRIVIAL(warning) << "PipeWireSession: failed to start thread loop";
        spa_hook_remove(&coreListener_);
        pw_core_disconnect(core_); core_ = nullptr;
        pw_context_destroy(context_); context_ = nullptr;
        pw_thread_loop_destroy(threadLoop_); threadLoop_ = nullptr;
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "PipeWireSession: connected to PipeWire daemon";
}

PipeWireSession::~PipeWireSession()
{
    if (threadLoop_) {
        pw_thread_loop_lock(threadLoop_);
        if (core_)
            spa_hook_remove(&coreListener_);
        pw_thread_loop_unlock(threadLoop_);
        pw_thread_loop_stop(threadLoop_);
    }

    if (core_)
        pw_core_disconnect(core_);
    if (context_)
        pw_context_destroy(context_);
    if (threadLoop_)
        pw_thread_loop_destroy(threadLoop_);

    pw_deinit();
}

int PipeWireSession::roundtrip()
{
    if (!core_)
        return connectError_;
    if (fatalError_)
        return fatalError_;

    syncDone_ = false;
    pendingSeq_ = pw_core_sync(core_, PW_ID_CORE, pendingSeq_);
    while (!syncDone_ && !fatalError_)
        pw_thread_loop_wait(threadLoop_);

    return fatalError_;
}

void PipeWireSession::onCoreDone(void* data, uint32_t id, int seq)
{
    auto* self = static_cast<PipeWireSession*>(data);
    if (id != PW_ID_CORE || seq != self->pendingSeq_)
        return;
    self->syncDone_ = true;
    pw_thread_loop_signal(self->threadLoop_, false);
}

void PipeWireSession::onCoreError(void* data, uint32_t id, int seq, int res, const char* message)
{
    auto* self = static_cast<PipeWireSession*>(data);
    BOOST_LOG_TRIVIAL(debug) << "PipeWireSession: error on object " << id << " seq " << seq
                             << ": " << res << " (" << (message ? message : "") << ")";

    // Errors on other proxies are routed to their own listeners.
    if (id == PW_ID_CORE && res == -EPIPE) {
        self->fatalError_ = res;
        pw_thread_loop_signal(self->threadLoop_, false);
    }
}

PipeWireSession::Lock::Lock(PipeWireSession& session)
    : loop_(session.threadLoop_)
{
    if (loop_)
        pw_thread_loop_lock(loop_);
}

PipeWireSession::Lock::~Lock()
{
    if (loop_)
        pw_thread_loop_unlock(loop_);
}

} // namespace mos
