#pragma once

#include <pipewire/pipewire.h>

namespace mos {

/// Connection to the PipeWire daemon: thread loop, context and core.
///
/// Construction never throws; if the daemon is unreachable isConnected()
/// is false and connectError() holds the negative errno. All calls that
/// touch PipeWire objects must be made with the loop locked (see Lock).
class PipeWireSession {
public:
    PipeWireSession();
    ~PipeWireSession();

    PipeWireSession(const PipeWireSession&) = delete;
    PipeWireSession& operator=(const PipeWireSession&) = delete;

    bool isConnected() const { return core_ != nullptr; }
    int connectError() const { return connectError_; }

    struct pw_core* core() const { return core_; }

    /// Block until the daemon has processed every request sent so far.
    /// Events for earlier requests are dispatched before this returns.
    /// Returns 0, or a negative errno if the connection broke meanwhile.
    int roundtrip();

    class Lock {
    public:
        explicit Lock(PipeWireSession& session);
        ~Lock();
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
    private:
        struct pw_thread_loop* loop_;
    };

private:
    static void onCoreDone(void* data, uint32_t id, int seq);
    static void onCoreError(void* data, uint32_t id, int seq, int res, const char* message);

    struct pw_thread_loop* threadLoop_ = nullptr;
    struct pw_context* context_ = nullptr;
    struct pw_core* core_ = nullptr;
    struct spa_hook coreListener_{};

    int connectError_ = 0;
    int pendingSeq_ = 0;
    bool syncDone_ = false;
    int fatalError_ = 0;
};

} // namespace mos
