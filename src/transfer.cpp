// -----------------------------------------------------------------------------
// @file transfer.cpp
// @brief Transfer controller: session lifecycle, chunk loop, retry policy, events.
//
// Each session runs on two threads:
// - the worker, which owns the chunk loop and is the only caller of the
//   transport for this session;
// - the notifier, which drains the session's EventChannel and is the only
//   caller of the observer.
//
// Locking rules (read before touching this file):
// - `mutex_` guards every member below it in the class. Held only for short
//   bookkeeping; never across a transport exchange or an observer callback.
// - `EventChannel::mutex` guards the queue. It may be taken while `mutex_` is
//   held (worker pushing), never the other way round.
// - `start_mutex_` serialises start() callers; a second concurrent start()
//   is rejected, not queued.
// -----------------------------------------------------------------------------
#include "mcumgr/transfer.hpp"

#include <chrono>
#include <deque>

namespace mcumgr {

// =============================================================================
// Event channel
// =============================================================================

// Queue between the worker and the notifier of one session.
// Shared by both threads, and it outlives the controller when an observer
// destroys the controller from inside a callback.
struct TransferController::EventChannel {
    enum class Kind : uint8_t { Progress, Completed, Cancelled, Failed };

    struct Event {
        Kind     kind{Kind::Progress};
        uint32_t offset{0};
        uint32_t total{0};
        uint64_t timestamp_ms{0};
        Bytes    data;                    // Completed (download) only
        Error    error;                   // Failed only
    };

    std::mutex              mutex;
    std::condition_variable cv;
    std::deque<Event>       events;
    std::size_t             pending{0};       // queued + currently being delivered
    bool                    orphaned{false};  // controller destroyed; deliver nothing more

    void push(Event ev) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(std::move(ev));
            ++pending;
        }
        cv.notify_all();
    }
};

const char* to_string(TransferState s) {
    switch (s) {
        case TransferState::Idle:      return "idle";
        case TransferState::Active:    return "active";
        case TransferState::Paused:    return "paused";
        case TransferState::Completed: return "completed";
        case TransferState::Cancelled: return "cancelled";
        case TransferState::Failed:    return "failed";
    }
    return "unknown";
}

// Wall-clock milliseconds for on_progress timestamps.
static uint64_t now_ms_system() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Construction & teardown
// =============================================================================

TransferController::TransferController(Client& client, TransferObserver& observer,
                                       const TransferConfig& cfg)
    : client_(client), observer_(observer), max_retries_(cfg.max_retries) {}

TransferController::~TransferController() {
    shutdown();
}

// -----------------------------------------------------------------------------
// shutdown()
// ----------
// Cancels a running session, then waits for both session threads.
// - From any ordinary thread: joins the worker, then the notifier (which exits
//   once the Cancelled event is delivered).
// - From an observer callback (the notifier itself): the worker is still
//   joined; the notifier is marked orphaned and detached, so it returns from
//   the callback and exits without touching this object.
// -----------------------------------------------------------------------------
void TransferController::shutdown() {
    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TransferState::Active || state_ == TransferState::Paused) {
            state_ = TransferState::Cancelled;       // worker sees this after its exchange
            last_progress_ = Progress{};
        }
        channel = channel_;
    }
    cv_.notify_all();                                // wake a paused worker

    const std::thread::id self = std::this_thread::get_id();

    if (worker_.joinable()) {
        if (worker_.get_id() == self) worker_.detach();   // torn down from inside a transport call
        else                          worker_.join();
    }

    if (!notifier_.joinable()) return;
    if (notifier_.get_id() == self) {
        if (channel) {
            {
                std::lock_guard<std::mutex> lock(channel->mutex);
                channel->orphaned = true;            // stop after the current callback
            }
            channel->cv.notify_all();
        }
        notifier_.detach();
    } else {
        notifier_.join();                            // terminal event delivered
    }
}

// =============================================================================
// Session start
// =============================================================================

Error TransferController::start_session(TransferSession session) {
    std::unique_lock<std::mutex> starting(start_mutex_, std::try_to_lock);
    if (!starting.owns_lock()) return Error(ErrorCode::AlreadyInProgress);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TransferState::Active || state_ == TransferState::Paused)
            return Error(ErrorCode::AlreadyInProgress);

        // Called from one of our own session threads: neither can join itself.
        const std::thread::id self = std::this_thread::get_id();
        if (worker_.get_id() == self || notifier_.get_id() == self)
            return Error(ErrorCode::AlreadyInProgress);
    }
    if (worker_.joinable())   worker_.join();     // previous session is terminal; worker is exiting
    if (notifier_.joinable()) notifier_.join();   // its terminal event is being delivered

    // Phase: size chunks against the link as it is right now
    transport::ITransport& link = client_.transport();
    const std::size_t overhead = HEADER_LENGTH + (is_coap(link.scheme()) ? COAP_OVERHEAD : 0);
    const std::size_t mtu = link.mtu();
    if (mtu <= overhead) return Error(ErrorCode::MtuTooSmall);
    session.chunk_size = mtu - overhead;          // body bytes one packet may carry
    session.offset = 0;

    // Best effort: links without a faster connection mode simply decline.
    link.request_high_throughput();

    // Phase: publish the session and launch both threads
    auto channel = std::make_shared<EventChannel>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_       = std::make_unique<TransferSession>(std::move(session));
        channel_       = channel;
        state_         = TransferState::Active;
        error_         = Error();
        retries_       = 0;
        in_flight_     = false;
        running_       = true;
        last_progress_ = Progress{0, session_->total_known ? session_->total : 0};
    }
    worker_   = std::thread(&TransferController::run_loop, this, channel);
    notifier_ = std::thread(&TransferController::notify_loop, this, channel);
    return Error();
}

// =============================================================================
// Control
// =============================================================================

Error TransferController::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != TransferState::Active) return Error(ErrorCode::NotInProgress);
        state_ = TransferState::Paused;
    }
    cv_.notify_all();
    return Error();
}

Error TransferController::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != TransferState::Paused) return Error(ErrorCode::NotInProgress);
        state_ = TransferState::Active;
    }
    cv_.notify_all();
    return Error();
}

Error TransferController::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != TransferState::Active && state_ != TransferState::Paused)
            return Error(ErrorCode::NotInProgress);
        state_ = TransferState::Cancelled;
        last_progress_ = Progress{};
    }
    cv_.notify_all();
    return Error();
}

// Two stages: the worker parks or finishes, then the notifier catches up.
void TransferController::wait() {
    std::shared_ptr<EventChannel> channel;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !running_ || (state_ == TransferState::Paused && !in_flight_);
        });
        channel = channel_;
    }
    if (!channel) return;                         // never started

    std::unique_lock<std::mutex> lock(channel->mutex);
    channel->cv.wait(lock, [&channel] { return channel->pending == 0 || channel->orphaned; });
}

TransferState TransferController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Progress TransferController::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ && (state_ == TransferState::Active || state_ == TransferState::Paused))
        return Progress{session_->offset, session_->total};
    return last_progress_;
}

Error TransferController::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void TransferController::set_max_retries(uint8_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_retries_ = n;
}

uint8_t TransferController::max_retries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_retries_;
}

// =============================================================================
// Chunk loop (worker thread)
// =============================================================================

void TransferController::finish_locked(TransferState final_state, const Error& error) {
    state_ = final_state;
    error_ = error;
}

// -----------------------------------------------------------------------------
// run_loop()
// ----------
// One iteration per chunk request:
//   1. wait out a pause, build the request for the current offset
//   2. exchange it with the device (no lock held)
//   3. apply the reply, or count a retry, or fail the session
// Progress events are queued under `mutex_`, so a parked or finished worker
// has always queued everything wait() must see delivered.
// Ends by queueing exactly one terminal event and clearing `running_`.
// -----------------------------------------------------------------------------
void TransferController::run_loop(std::shared_ptr<EventChannel> channel) {
    for (;;) {
        Op op = Op::Read;
        uint16_t group = 0;
        uint8_t id = 0;
        Document body;

        // Phase 1: wait out a pause, then build the request for the current offset
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return state_ != TransferState::Paused; });
            if (state_ != TransferState::Active) break;         // cancelled while paused

            Error e = build_chunk(*session_, op, group, id, body);
            if (!e.ok()) { finish_locked(TransferState::Failed, e); break; }
            in_flight_ = true;
        }

        // Phase 2: one exchange, no lock held
        Response rsp;
        Error e = client_.execute(op, group, id, body, rsp);

        // Phase 3: fold the result into the session
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
            if (state_ == TransferState::Cancelled) break;      // reply discarded

            if (e.ok()) e = apply_chunk(rsp, *session_);

            if (e.ok()) {
                retries_ = 0;                                   // budget is per chunk
                last_progress_ = Progress{session_->offset, session_->total};

                EventChannel::Event ev;
                ev.kind         = EventChannel::Kind::Progress;
                ev.offset       = session_->offset;
                ev.total        = session_->total;
                ev.timestamp_ms = now_ms_system();
                channel->push(std::move(ev));

                if (session_->total_known && session_->offset >= session_->total)
                    state_ = TransferState::Completed;
            } else if (is_transient(e.code) && retries_ < max_retries_) {
                ++retries_;                                     // same offset next round
            } else {
                finish_locked(TransferState::Failed, e);
            }
        }
        cv_.notify_all();                                       // wait() may be parked-waiting
    }

    // Terminal: discard the session, then exactly one event
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EventChannel::Event ev;
        switch (state_) {
            case TransferState::Completed:
                ev.kind = EventChannel::Kind::Completed;
                if (session_) ev.data = std::move(session_->data);
                break;
            case TransferState::Cancelled:
                ev.kind = EventChannel::Kind::Cancelled;
                last_progress_ = Progress{};
                break;
            default:
                ev.kind  = EventChannel::Kind::Failed;
                ev.error = error_;
                last_progress_ = Progress{};
                break;
        }
        session_.reset();
        channel->push(std::move(ev));
        running_ = false;
    }
    cv_.notify_all();
}

// =============================================================================
// Event delivery (notifier thread)
// =============================================================================

// -----------------------------------------------------------------------------
// notify_loop()
// -------------
// Delivers the session's events in queue order, each once, then exits after
// the terminal one. A callback may destroy the controller; after every
// callback only `channel` is touched until the orphaned flag has been checked.
// -----------------------------------------------------------------------------
void TransferController::notify_loop(std::shared_ptr<EventChannel> channel) {
    for (;;) {
        EventChannel::Event ev;
        {
            std::unique_lock<std::mutex> lock(channel->mutex);
            channel->cv.wait(lock, [&channel] {
                return !channel->events.empty() || channel->orphaned;
            });
            if (channel->orphaned) return;
            ev = std::move(channel->events.front());
            channel->events.pop_front();
        }

        const bool terminal = ev.kind != EventChannel::Kind::Progress;
        switch (ev.kind) {
            case EventChannel::Kind::Progress:
                observer_.on_progress(ev.offset, ev.total, ev.timestamp_ms);
                break;
            case EventChannel::Kind::Completed:
                notify_completed(std::move(ev.data));
                break;
            case EventChannel::Kind::Cancelled:
                observer_.on_cancelled();
                break;
            case EventChannel::Kind::Failed:
                observer_.on_failed(ev.error);
                break;
        }

        // `this` may be gone from here on
        bool stop = false;
        {
            std::lock_guard<std::mutex> lock(channel->mutex);
            --channel->pending;
            stop = terminal || channel->orphaned;
        }
        channel->cv.notify_all();                               // wake wait()
        if (stop) return;
    }
}

} // namespace mcumgr
