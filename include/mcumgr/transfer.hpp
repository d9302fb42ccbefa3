/**
 * @file transfer.hpp
 * @brief Chunked, resumable transfer state machine shared by uploads and downloads.
 *
 * @details
 * A transfer moves one resource (a file path, an image slot) between host and
 * device in chunks small enough for the link's MTU. The controller owns the
 * session, drives the chunk loop, retries transient failures, and reports
 * progress and exactly one terminal event to an observer.
 *
 * @par State machine
 * ```
 *            start()
 *   Idle ───────────────► Active ──(chunk loop)──► Active
 *                          │  ▲
 *                 pause()  │  │ resume()
 *                          ▼  │
 *                         Paused
 *
 *   Active ──► Completed | Failed | Cancelled
 *   Paused ──► Cancelled               (cancel())
 * ```
 * Terminal states drop the session; a new start() begins a fresh one.
 *
 * @par Operational model
 * - start() validates, sizes chunks from `mtu()`, asks the link for a
 *   high-throughput mode (failure ignored) and spawns two threads for the
 *   session: the worker and the notifier.
 * - The worker is the only thread that talks to the transport for this
 *   session. At most one chunk request is in flight, so offsets stay ordered
 *   without extra locking. It never calls the observer; it queues events.
 * - The notifier delivers queued events in order, each exactly once. A slow
 *   observer delays later events, never the next chunk request.
 * - pause(), resume() and cancel() may be called from any thread. They flip
 *   the state under the controller mutex and wake the worker. A chunk already
 *   in flight finishes first: its reply is still applied after a pause, and
 *   discarded after a cancel.
 * - Observer callbacks run on the notifier, outside every lock. They may call
 *   pause(), resume(), cancel(), or destroy the controller. They must not call
 *   wait() or start().
 *
 * @par Failure model
 * - Transient errors (`is_transient()`: timeouts, disconnects, stale replies)
 *   retry the same chunk up to `max_retries()` times. The counter resets after
 *   every accepted chunk.
 * - Everything else (decode errors, CoAP errors, non-zero rc, MTU too small)
 *   fails the session at once. Partial data is discarded.
 *
 * @par Minimal usage
 * @code
 * mcumgr::Client client(serial);
 * mcumgr::FileDownloader dl(client, my_observer);
 * dl.start("/lfs/log.txt");
 * dl.wait();            // or keep the UI responsive and react to callbacks
 * @endcode
 */
#ifndef MCUMGR_TRANSFER_HPP
#define MCUMGR_TRANSFER_HPP

#include <stdint.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "mcumgr/client.hpp"
#include "mcumgr/error.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/response.hpp"

namespace mcumgr {

enum class TransferState : uint8_t {
  Idle = 0,
  Active,
  Paused,
  Completed,
  Cancelled,
  Failed
};

const char* to_string(TransferState s);

/// Offset and total of the running (or last) session.
struct Progress {
  uint32_t offset{0};
  uint32_t total{0};
};

/**
 * @brief Events common to every transfer direction.
 *
 * Exactly one of on_cancelled / on_failed / the variant's completion callback
 * fires per session. on_progress is monotonically non-decreasing within a
 * session.
 */
class TransferObserver {
public:
  virtual ~TransferObserver() = default;
  virtual void on_progress(uint32_t current, uint32_t total, uint64_t timestamp_ms) = 0;
  virtual void on_cancelled() = 0;
  virtual void on_failed(const Error& error) = 0;
};

/// One in-flight transfer. Owned by the controller, touched under its mutex.
struct TransferSession {
  std::string resource;          ///< file path, or image slot rendered as text
  uint32_t    total{0};
  bool        total_known{false};
  uint32_t    offset{0};         ///< bytes acknowledged by the peer
  std::size_t chunk_size{0};     ///< body bytes one packet may carry
  Bytes       data;              ///< assembled (download) or source (upload) bytes
};

/// Construction-time policy.
struct TransferConfig {
  uint8_t max_retries{3};
};

class TransferController {
public:
  /// Default retry ceiling per chunk.
  static constexpr uint8_t RETRIES_DEFAULT = 3;

  /// Bytes reserved for CoAP header, token, options and the `_h` field.
  static constexpr std::size_t COAP_OVERHEAD = 32;

  virtual ~TransferController();

  TransferController(const TransferController&) = delete;
  TransferController& operator=(const TransferController&) = delete;

  /// Active → Paused. `NotInProgress` from any other state.
  Error pause();

  /// Paused → Active. `NotInProgress` from any other state.
  Error resume();

  /**
   * @brief Active|Paused → Cancelled.
   *
   * The worker delivers on_cancelled once it observes the change (after the
   * in-flight chunk, if any, returns). Calling again, or on a finished
   * controller, changes nothing and reports `NotInProgress`.
   */
  Error cancel();

  /**
   * @brief Block until the worker is parked (paused, nothing in flight) or
   *        has finished, and every event queued so far has been delivered.
   */
  void wait();

  TransferState state() const;
  Progress      progress() const;

  /// Error attached to the last Failed session; Ok otherwise.
  Error last_error() const;

  /// @name Policy knobs
  ///@{
  void    set_max_retries(uint8_t n);
  uint8_t max_retries() const;
  ///@}

protected:
  TransferController(Client& client, TransferObserver& observer, const TransferConfig& cfg);

  /// Validate nothing runs, size chunks, and launch the worker for @p session.
  Error start_session(TransferSession session);

  /// Fill one chunk request for @p s.offset.
  virtual Error build_chunk(const TransferSession& s, Op& op, uint16_t& group,
                            uint8_t& id, Document& body) = 0;

  /**
   * @brief Apply an accepted reply to @p s.
   *
   * Must either succeed and advance the session, or fail without touching it.
   * Return `SequenceMismatch` for replies that belong to another offset.
   */
  virtual Error apply_chunk(const Response& rsp, TransferSession& s) = 0;

  /// Deliver the completion event with the session's data.
  virtual void notify_completed(Bytes&& data) = 0;

  /**
   * @brief Cancel any session and join the session threads.
   *
   * Every concrete controller calls this from its destructor, while its
   * overrides are still alive for the threads to finish with. Called from an
   * observer callback, it stops further delivery and lets the notifier run
   * out without touching the controller again.
   */
  void shutdown();

  Client& client_;

private:
  struct EventChannel;

  void run_loop(std::shared_ptr<EventChannel> channel);
  void notify_loop(std::shared_ptr<EventChannel> channel);
  void finish_locked(TransferState final_state, const Error& error);

  TransferObserver& observer_;

  mutable std::mutex          mutex_;
  std::condition_variable     cv_;
  std::mutex                  start_mutex_;
  std::thread                 worker_;
  std::thread                 notifier_;

  TransferState                    state_{TransferState::Idle};
  std::unique_ptr<TransferSession> session_;
  std::shared_ptr<EventChannel>    channel_;   ///< events of the current (or last) session
  Progress                         last_progress_;
  Error                            error_;
  uint8_t                          max_retries_{RETRIES_DEFAULT};
  uint8_t                          retries_{0};
  bool                             in_flight_{false};
  bool                             running_{false};
};

} // namespace mcumgr

#endif // MCUMGR_TRANSFER_HPP
