#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "common/auth/peer_key_store.h"
#include "common/crypto/crypto_envelope.h"
#include "common/errors/error.h"
#include "common/handshake/handshake_processor.h"
#include "common/session/reconnect_backoff.h"
#include "common/utils/thread_checker.h"
#include "transport/frame/frame.h"
#include "transport/session/liveness_monitor.h"
#include "transport/session/retransmit_buffer.h"
#include "transport/session/session_config.h"
#include "transport/stream/byte_stream.h"
#include "transport/transfer/transfer_manager.h"

namespace ghostlink::transport {

enum class SessionState : std::uint8_t {
  kDisconnected,
  kConnecting,
  kHandshaking,
  kEstablished,
  kDegraded,
  kReconnecting,
  kClosed,
};

const char* to_string(SessionState state) noexcept;

struct SessionStats {
  std::uint64_t frames_sent{0};
  std::uint64_t frames_received{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t bytes_received{0};
  std::uint64_t frames_replayed{0};

  // Errors.
  std::uint64_t frame_errors{0};
  std::uint64_t crypto_errors{0};
  std::uint64_t transfers_failed{0};
  std::error_code last_frame_error;

  // Delivery.
  std::uint64_t messages_delivered{0};
  std::uint64_t media_delivered{0};

  // Connection.
  std::uint64_t reconnect_count{0};
  std::uint64_t session_id{0};
  std::uint64_t next_send_seq{0};
  std::uint64_t next_recv_seq{0};
};

// Callback types.
using MessageCallback = std::function<void(const std::string& text)>;
using MediaCallback =
    std::function<void(const std::vector<std::uint8_t>& bytes, const std::string& mime_hint)>;
using StateChangeCallback = std::function<void(SessionState old_state, SessionState new_state)>;
using ErrorCallback =
    std::function<void(ErrorKind kind, const std::error_code& ec, const std::string& detail)>;

/**
 * One logical conversation between HOST and CLIENT, surviving transport drops.
 *
 * listen() (HOST) or connect() (CLIENT) starts a control thread that owns the
 * state machine and is the only writer on the stream. Every connection gets
 * its own reader thread, which drains the stream through a StreamReassembler
 * and posts frames to the control thread. Application commands are posted to
 * the same queue, so sends, heartbeats, chunk traffic and BYE never interleave
 * on the wire.
 *
 * Callbacks run on the control thread. They may call send_text(), send_media(),
 * rotate_key() and disconnect(), but must not block, and must not destroy the
 * Session: its destructor joins the control thread.
 *
 * Thread Safety:
 *   All public methods are thread-safe. Callbacks must be registered before
 *   listen() / connect().
 */
class Session {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  // key_store may be null; keys are then kept in memory only.
  Session(SessionConfig config, std::unique_ptr<StreamConnector> connector,
          std::shared_ptr<auth::PeerKeyStore> key_store,
          std::function<TimePoint()> now_fn = Clock::now);
  ~Session();

  // Non-copyable, non-movable.
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(Session&&) = delete;

  // HOST: wait for the CLIENT on the connector.
  bool listen(std::error_code& ec);

  // CLIENT: connect through the connector; peer is the identity keys are pinned under.
  bool connect(const std::string& peer, std::error_code& ec);

  // Queue a message. Accepted while the session is starting, established or
  // reconnecting; sent once ESTABLISHED. Fails with TransportError::kClosed
  // when DISCONNECTED or CLOSED.
  bool send_text(std::string text, std::error_code& ec);
  bool send_media(std::vector<std::uint8_t> bytes, std::error_code& ec);

  // Wait until queued messages and transfers are acknowledged, then drop the
  // pinned key and reconnect with a fresh key agreement.
  bool rotate_key(std::error_code& ec);

  // Best-effort BYE, then CLOSED. Blocks until the control thread has exited
  // unless called from a callback.
  void disconnect();

  // Close the current stream without BYE, as if the link had dropped.
  void drop_link();

  SessionState state() const { return state_.load(); }
  bool wait_for_state(SessionState target, std::chrono::milliseconds timeout) const;

  SessionStats stats() const;
  Role role() const { return config_.role; }
  const std::string& peer_id() const { return peer_id_; }

  void on_message(MessageCallback callback) { on_message_ = std::move(callback); }
  void on_media(MediaCallback callback) { on_media_ = std::move(callback); }
  void on_state_change(StateChangeCallback callback) { on_state_change_ = std::move(callback); }
  void on_error(ErrorCallback callback) { on_error_ = std::move(callback); }

 private:
  // How one connection ended and what the control loop does next.
  enum class LinkOutcome : std::uint8_t {
    kReconnect,      // backoff, then a new connect cycle
    kReconnectNow,   // new connect cycle without backoff (key rotation)
    kDisconnected,   // handshake or crypto failure, surfaced
    kClosed,         // BYE or local disconnect
  };

  struct Event {
    enum class Kind : std::uint8_t {
      kFrame,
      kStreamError,
      kSendText,
      kSendMedia,
      kRotateKey,
      kDropLink,
      kWake,
    };
    Kind kind{Kind::kWake};
    std::uint64_t generation{0};
    frame::Frame frame;
    std::error_code error;
    std::string text;
    std::vector<std::uint8_t> bytes;
  };

  // The CLIENT's key-confirmation frame, dispatched once ESTABLISHED.
  struct OpenedFrame {
    frame::FrameType type{frame::FrameType::kPing};
    std::vector<std::uint8_t> plaintext;
  };

  bool start(Role expected_role, const std::string& peer, std::error_code& ec);
  void post(Event event);
  void control_loop();
  LinkOutcome run_connection();
  LinkOutcome outcome_for(const std::error_code& ec, const std::string& context);

  // Connection setup.
  std::unique_ptr<ByteStream> open_stream(std::error_code& ec);
  void attach_stream(std::unique_ptr<ByteStream> stream);
  void teardown_stream();
  void reader_loop(std::shared_ptr<ByteStream> stream, std::uint64_t generation);

  // Handshake.
  handshake::HandshakeParams handshake_params() const;
  bool handshake_as_host(std::error_code& ec);
  bool handshake_as_client(std::optional<OpenedFrame>& first, std::error_code& ec);
  bool apply_outcome(const handshake::HandshakeOutcome& outcome, std::error_code& ec);
  void pin_key(const crypto::SessionKey& key);
  bool replay_unacknowledged(std::uint64_t peer_next_recv_seq, std::error_code& ec);

  // Established traffic.
  LinkOutcome serve();
  bool wait_frame(TimePoint deadline, frame::Frame& out, std::error_code& ec);
  bool pop_event(TimePoint deadline, Event& out);
  void handle_command(Event& event);
  bool open_frame(const frame::Frame& frame, std::vector<std::uint8_t>& plaintext,
                  std::error_code& ec);
  bool dispatch(frame::FrameType type, std::vector<std::uint8_t> plaintext, bool& bye,
                std::error_code& ec);
  bool flush_outbound(std::error_code& ec);
  bool send_sealed(frame::FrameType type, std::span<const std::uint8_t> plaintext,
                   std::error_code& ec);
  bool send_heartbeat(frame::FrameType type, std::error_code& ec);
  bool write_wire(std::span<const std::uint8_t> wire, std::error_code& ec);
  void send_bye();
  void acknowledge(std::uint64_t peer_next_recv_seq);
  void reset_sequences();
  void deliver(transfer::CompletedTransfer completed);
  void report_dropped(const std::vector<transfer::DroppedTransfer>& dropped);
  void report_undelivered();

  void set_state(SessionState new_state);
  void surface_error(const std::error_code& ec, const std::string& detail);
  void surface_error(ErrorKind kind, const std::error_code& ec, const std::string& detail);
  void update_sequence_stats();

  SessionConfig config_;
  std::unique_ptr<StreamConnector> connector_;
  std::shared_ptr<auth::PeerKeyStore> key_store_;
  std::function<TimePoint()> now_fn_;
  std::string peer_id_;

  // Lifecycle.
  std::mutex lifecycle_mutex_;
  std::thread control_thread_;
  // Set by the control thread itself; cleared once it has been joined.
  std::atomic<std::thread::id> control_thread_id_{};
  std::atomic<bool> stop_requested_{false};
  std::atomic<SessionState> state_{SessionState::kDisconnected};
  mutable std::mutex state_mutex_;
  mutable std::condition_variable state_cv_;

  // Event queue shared by the reader thread, the application and the control thread.
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable space_cv_;
  std::deque<Event> events_;
  std::size_t queued_frames_{0};
  std::uint64_t generation_{0};

  // Everything below is owned by the control thread.
  GHOSTLINK_THREAD_CHECKER(thread_checker_);
  std::shared_ptr<ByteStream> stream_;
  std::thread reader_;
  std::unique_ptr<crypto::CryptoEnvelope> envelope_;
  std::uint64_t send_seq_{0};
  std::uint64_t recv_seq_{0};
  std::uint64_t session_id_{0};
  bool have_session_{false};
  bool resume_allowed_{true};
  bool rotate_requested_{false};
  bool ever_connected_{false};
  RetransmitBuffer retransmit_;
  LivenessMonitor liveness_;
  session::ReconnectBackoff backoff_;
  transfer::TransferManager transfers_;
  std::deque<std::string> pending_text_;

  mutable std::mutex stats_mutex_;
  SessionStats stats_;

  MessageCallback on_message_;
  MediaCallback on_media_;
  StateChangeCallback on_state_change_;
  ErrorCallback on_error_;
};

}  // namespace ghostlink::transport
