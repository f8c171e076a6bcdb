#include "transport/session/session.h"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

#include "common/logging/logger.h"
#include "common/media/mime_sniffer.h"
#include "transport/frame/frame_codec.h"
#include "transport/frame/stream_reassembler.h"

namespace {

// Frames the reader may queue ahead of the control thread.
constexpr std::size_t kMaxQueuedFrames = 64;

std::uint64_t wall_clock_ms() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

std::span<const std::uint8_t> as_bytes(const std::string& text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

namespace ghostlink::transport {

const char* to_string(SessionState state) noexcept {
  switch (state) {
    case SessionState::kDisconnected:
      return "DISCONNECTED";
    case SessionState::kConnecting:
      return "CONNECTING";
    case SessionState::kHandshaking:
      return "HANDSHAKING";
    case SessionState::kEstablished:
      return "ESTABLISHED";
    case SessionState::kDegraded:
      return "DEGRADED";
    case SessionState::kReconnecting:
      return "RECONNECTING";
    case SessionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

Session::Session(SessionConfig config, std::unique_ptr<StreamConnector> connector,
                 std::shared_ptr<auth::PeerKeyStore> key_store, std::function<TimePoint()> now_fn)
    : config_(std::move(config)),
      connector_(std::move(connector)),
      key_store_(key_store ? std::move(key_store) : std::make_shared<auth::PeerKeyStore>()),
      now_fn_(std::move(now_fn)),
      peer_id_(config_.peer_id),
      retransmit_(config_.retransmit),
      liveness_(config_.heartbeat, now_fn_),
      backoff_(config_.reconnect),
      transfers_(config_.transfer, now_fn_) {
  if (!connector_) {
    throw std::invalid_argument("Session requires a stream connector");
  }
}

Session::~Session() {
  if (control_thread_id_.load() == std::this_thread::get_id()) {
    LOG_ERROR("Session destroyed from its own callback; the control thread cannot be joined");
  }
  disconnect();
}

// ----------------------------------------------------------------------------
// Public API
// ----------------------------------------------------------------------------

bool Session::listen(std::error_code& ec) { return start(Role::kHost, {}, ec); }

bool Session::connect(const std::string& peer, std::error_code& ec) {
  if (!auth::is_valid_peer_id(peer)) {
    LOG_ERROR("Invalid peer id '{}'", peer);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  return start(Role::kClient, peer, ec);
}

bool Session::start(Role expected_role, const std::string& peer, std::error_code& ec) {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (config_.role != expected_role) {
    LOG_ERROR("{}() called on a {} session", expected_role == Role::kHost ? "listen" : "connect",
              to_string(config_.role));
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  const auto current = state();
  if (current == SessionState::kClosed || stop_requested_) {
    ec = TransportError::kClosed;
    return false;
  }
  if (current != SessionState::kDisconnected) {
    ec = std::make_error_code(std::errc::operation_in_progress);
    return false;
  }
  if (control_thread_.joinable()) {
    control_thread_.join();
    control_thread_id_ = std::thread::id{};
  }
  if (!peer.empty()) {
    peer_id_ = peer;
  }
  set_state(SessionState::kConnecting);
  control_thread_ = std::thread(&Session::control_loop, this);
  return true;
}

bool Session::send_text(std::string text, std::error_code& ec) {
  const auto current = state();
  if (current == SessionState::kDisconnected || current == SessionState::kClosed ||
      stop_requested_) {
    ec = TransportError::kClosed;
    return false;
  }
  Event event{};
  event.kind = Event::Kind::kSendText;
  event.text = std::move(text);
  post(std::move(event));
  return true;
}

bool Session::send_media(std::vector<std::uint8_t> bytes, std::error_code& ec) {
  const auto current = state();
  if (current == SessionState::kDisconnected || current == SessionState::kClosed ||
      stop_requested_) {
    ec = TransportError::kClosed;
    return false;
  }
  if (bytes.size() > config_.transfer.max_transfer_bytes) {
    ec = TransferError::kTooLarge;
    return false;
  }
  Event event{};
  event.kind = Event::Kind::kSendMedia;
  event.bytes = std::move(bytes);
  post(std::move(event));
  return true;
}

bool Session::rotate_key(std::error_code& ec) {
  const auto current = state();
  if (current == SessionState::kDisconnected || current == SessionState::kClosed ||
      stop_requested_) {
    ec = TransportError::kClosed;
    return false;
  }
  Event event{};
  event.kind = Event::Kind::kRotateKey;
  post(std::move(event));
  return true;
}

void Session::drop_link() {
  Event event{};
  event.kind = Event::Kind::kDropLink;
  post(std::move(event));
}

void Session::disconnect() {
  stop_requested_ = true;
  connector_->cancel();
  post(Event{});
  space_cv_.notify_all();

  if (control_thread_id_.load() == std::this_thread::get_id()) {
    // Called from a callback; the control loop sees the flag and finishes on its own.
    return;
  }
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (control_thread_.joinable()) {
    control_thread_.join();
    control_thread_id_ = std::thread::id{};
  }
  if (state() != SessionState::kClosed) {
    set_state(SessionState::kClosed);
  }
}

bool Session::wait_for_state(SessionState target, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [&] { return state_.load() == target; });
}

SessionStats Session::stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_;
}

void Session::post(Event event) {
  {
    std::lock_guard lock(queue_mutex_);
    events_.push_back(std::move(event));
  }
  queue_cv_.notify_all();
}

// ----------------------------------------------------------------------------
// Control loop
// ----------------------------------------------------------------------------

void Session::control_loop() {
  control_thread_id_ = std::this_thread::get_id();
  GHOSTLINK_BIND_THREAD(thread_checker_);
  LOG_INFO("Session started as {} (peer '{}')", to_string(config_.role), peer_id_);

  while (true) {
    const auto outcome = run_connection();
    teardown_stream();

    switch (outcome) {
      case LinkOutcome::kClosed: {
        const auto dropped = transfers_.cancel_all();
        if (!dropped.empty()) {
          LOG_INFO("Discarded {} in-flight transfer(s) on close", dropped.size());
        }
        set_state(SessionState::kClosed);
        GHOSTLINK_DETACH_THREAD(thread_checker_);
        return;
      }
      case LinkOutcome::kDisconnected:
        set_state(SessionState::kDisconnected);
        GHOSTLINK_DETACH_THREAD(thread_checker_);
        return;
      case LinkOutcome::kReconnectNow:
        set_state(SessionState::kReconnecting);
        continue;
      case LinkOutcome::kReconnect:
        break;
    }

    set_state(SessionState::kReconnecting);
    if (backoff_.exhausted()) {
      LOG_ERROR("Giving up on {} after {} reconnect attempts", peer_id_, backoff_.attempts());
      surface_error(ErrorKind::kFatal, make_error_code(TransportError::kClosed),
                    "reconnect attempts exhausted");
      report_dropped(transfers_.cancel_all());
      set_state(SessionState::kClosed);
      GHOSTLINK_DETACH_THREAD(thread_checker_);
      return;
    }

    const auto delay = backoff_.next_delay();
    {
      std::lock_guard lock(stats_mutex_);
      ++stats_.reconnect_count;
    }
    LOG_INFO("Reconnecting in {} ms (attempt {}/{})", delay.count(), backoff_.attempts(),
             config_.reconnect.max_attempts);

    // Wait out the backoff. Application commands keep being queued meanwhile.
    const auto deadline = now_fn_() + delay;
    Event event;
    while (!stop_requested_ && now_fn_() < deadline) {
      if (pop_event(deadline, event)) {
        handle_command(event);
      }
    }
  }
}

Session::LinkOutcome Session::run_connection() {
  if (stop_requested_) {
    return LinkOutcome::kClosed;
  }
  set_state(SessionState::kConnecting);

  std::error_code ec;
  auto stream = open_stream(ec);
  if (!stream) {
    return outcome_for(ec, "connect");
  }
  attach_stream(std::move(stream));

  set_state(SessionState::kHandshaking);
  std::optional<OpenedFrame> first;
  const bool ok =
      config_.role == Role::kHost ? handshake_as_host(ec) : handshake_as_client(first, ec);
  if (!ok) {
    return outcome_for(ec, "handshake");
  }

  ever_connected_ = true;
  backoff_.reset();
  liveness_.reset();
  // Transfers carried over a resume could not progress while the link was down.
  transfers_.touch_all();
  set_state(SessionState::kEstablished);

  if (first) {
    bool bye = false;
    if (!dispatch(first->type, std::move(first->plaintext), bye, ec)) {
      return outcome_for(ec, "receive");
    }
    if (bye) {
      return LinkOutcome::kClosed;
    }
  }
  return serve();
}

Session::LinkOutcome Session::outcome_for(const std::error_code& ec, const std::string& context) {
  if (stop_requested_ || ec == TransportError::kCancelled) {
    return LinkOutcome::kClosed;
  }
  switch (classify(ec)) {
    case ErrorKind::kTransport:
      LOG_WARN("{} with {} failed: {}", context, peer_id_, ec.message());
      return LinkOutcome::kReconnect;
    case ErrorKind::kFrame: {
      LOG_WARN("{} with {}: FrameError{{{}}}, reconnecting", context, peer_id_, ec.message());
      std::lock_guard lock(stats_mutex_);
      ++stats_.frame_errors;
      stats_.last_frame_error = ec;
      return LinkOutcome::kReconnect;
    }
    case ErrorKind::kCrypto: {
      LOG_ERROR("{} with {}: CryptoError{{{}}}, dropping connection", context, peer_id_,
                ec.message());
      {
        std::lock_guard lock(stats_mutex_);
        ++stats_.crypto_errors;
      }
      // No silent retry on the same traffic keys.
      have_session_ = false;
      surface_error(ec, context + ": " + ec.message());
      report_undelivered();
      report_dropped(transfers_.cancel_all());
      reset_sequences();
      return LinkOutcome::kDisconnected;
    }
    case ErrorKind::kHandshake:
      LOG_ERROR("{} with {}: HandshakeError{{{}}}", context, peer_id_, ec.message());
      surface_error(ec, context + ": " + ec.message());
      return LinkOutcome::kDisconnected;
    case ErrorKind::kTransfer:
      LOG_WARN("{} with {}: {}", context, peer_id_, ec.message());
      return LinkOutcome::kReconnect;
    case ErrorKind::kFatal:
      break;
  }
  return LinkOutcome::kClosed;
}

// ----------------------------------------------------------------------------
// Stream lifecycle
// ----------------------------------------------------------------------------

std::unique_ptr<ByteStream> Session::open_stream(std::error_code& ec) {
  while (!stop_requested_) {
    ec.clear();
    auto stream = connector_->open(config_.connect_timeout, ec);
    if (stream) {
      return stream;
    }
    // A HOST that has never seen its CLIENT keeps listening without spending attempts.
    const bool awaiting_first_client =
        config_.role == Role::kHost && !ever_connected_ && ec == TransportError::kTimeout;
    if (!awaiting_first_client) {
      return nullptr;
    }
    LOG_DEBUG("Still waiting for a client");
  }
  ec = TransportError::kCancelled;
  return nullptr;
}

void Session::attach_stream(std::unique_ptr<ByteStream> stream) {
  GHOSTLINK_DCHECK_THREAD(thread_checker_);
  stream_ = std::shared_ptr<ByteStream>(std::move(stream));
  if (config_.role == Role::kHost && config_.peer_id.empty()) {
    peer_id_ = stream_->peer_address();
  }
  std::uint64_t generation = 0;
  {
    std::lock_guard lock(queue_mutex_);
    generation = generation_;
  }
  reader_ = std::thread(&Session::reader_loop, this, stream_, generation);
  LOG_INFO("Stream open to {}", stream_->peer_address());
}

void Session::teardown_stream() {
  GHOSTLINK_DCHECK_THREAD(thread_checker_);
  if (stream_) {
    stream_->close();
  }
  {
    std::lock_guard lock(queue_mutex_);
    ++generation_;
    // Whatever the old reader left behind is stale; queued commands stay.
    std::erase_if(events_, [](const Event& e) {
      return e.kind == Event::Kind::kFrame || e.kind == Event::Kind::kStreamError;
    });
    queued_frames_ = 0;
  }
  space_cv_.notify_all();
  if (reader_.joinable()) {
    reader_.join();
  }
  stream_.reset();
}

void Session::reader_loop(std::shared_ptr<ByteStream> stream, std::uint64_t generation) {
  frame::StreamReassembler reassembler;
  std::vector<std::uint8_t> buffer(frame::kReadChunkSize);

  auto deliver_event = [&](Event event) {
    std::unique_lock lock(queue_mutex_);
    if (event.kind == Event::Kind::kFrame) {
      space_cv_.wait(lock, [&] {
        return queued_frames_ < kMaxQueuedFrames || generation_ != generation ||
               stop_requested_.load();
      });
    }
    if (generation_ != generation) {
      return false;
    }
    if (event.kind == Event::Kind::kFrame) {
      ++queued_frames_;
    }
    event.generation = generation;
    events_.push_back(std::move(event));
    lock.unlock();
    queue_cv_.notify_all();
    return true;
  };

  auto fail = [&](std::error_code ec) {
    Event event{};
    event.kind = Event::Kind::kStreamError;
    event.error = ec;
    deliver_event(std::move(event));
  };

  while (true) {
    std::error_code ec;
    const auto n = stream->read(buffer, ec);
    if (n == 0) {
      fail(ec ? ec : make_error_code(TransportError::kClosed));
      return;
    }
    if (!reassembler.feed(std::span<const std::uint8_t>(buffer.data(), n))) {
      fail(make_error_code(FrameError::kOversize));
      return;
    }
    while (true) {
      auto result = reassembler.next();
      if (result.status == frame::ReassemblyResult::Status::kNeedMore) {
        break;
      }
      if (result.status == frame::ReassemblyResult::Status::kError) {
        LOG_DEBUG("Reader stopping on malformed frame from {}", stream->peer_address());
        fail(make_error_code(result.error));
        return;
      }
      Event event{};
      event.kind = Event::Kind::kFrame;
      event.frame = std::move(result.frame);
      if (!deliver_event(std::move(event))) {
        return;
      }
    }
  }
}

// ----------------------------------------------------------------------------
// Handshake
// ----------------------------------------------------------------------------

handshake::HandshakeParams Session::handshake_params() const {
  handshake::HandshakeParams params{};
  params.pinned_key = key_store_->get(peer_id_);
  if (params.pinned_key && have_session_ && resume_allowed_) {
    params.resume = handshake::ResumeState{
        .session_id = session_id_,
        .next_send_seq = send_seq_,
        .next_recv_seq = recv_seq_,
        .replay_floor = retransmit_.replay_floor(),
    };
  }
  params.pairing_secret = config_.pairing_secret;
  return params;
}

bool Session::handshake_as_host(std::error_code& ec) {
  const auto deadline = now_fn_() + config_.handshake_timeout;
  handshake::HandshakeInitiator initiator(handshake_params());
  const auto hello = initiator.create_hello();
  if (!write_wire(frame::FrameCodec::encode(frame::FrameType::kHello, 0, hello), ec)) {
    return false;
  }

  frame::Frame reply;
  if (!wait_frame(deadline, reply, ec)) {
    return false;
  }
  if (reply.type != frame::FrameType::kHelloAck) {
    LOG_WARN("Expected HELLO_ACK, got {}", frame::to_string(reply.type));
    ec = HandshakeError::kUnexpectedFrame;
    return false;
  }

  HandshakeError error{};
  auto outcome = initiator.consume_hello_ack(reply.payload, error);
  if (!outcome) {
    ec = error;
    return false;
  }
  if (outcome->key_changed) {
    pin_key(outcome->key);
  }
  const bool applied = apply_outcome(*outcome, ec);
  sodium_memzero(outcome->key.data(), outcome->key.size());
  if (!applied) {
    return false;
  }
  if (outcome->mode == handshake::HelloMode::kResume &&
      !replay_unacknowledged(outcome->peer_next_recv_seq, ec)) {
    return false;
  }
  // The first sealed frame proves to the CLIENT that both sides hold the same key.
  return send_heartbeat(frame::FrameType::kPing, ec);
}

bool Session::handshake_as_client(std::optional<OpenedFrame>& first, std::error_code& ec) {
  const auto deadline = now_fn_() + config_.handshake_timeout;
  frame::Frame hello;
  if (!wait_frame(deadline, hello, ec)) {
    return false;
  }
  if (hello.type != frame::FrameType::kHello) {
    LOG_WARN("Expected HELLO, got {}", frame::to_string(hello.type));
    ec = HandshakeError::kUnexpectedFrame;
    return false;
  }

  handshake::HandshakeResponder responder(handshake_params());
  auto result = responder.handle_hello(hello.payload);
  if (!result.response.empty()) {
    std::error_code write_ec;
    if (!write_wire(
            frame::FrameCodec::encode(frame::FrameType::kHelloAck, 0, result.response),
            write_ec) &&
        result.outcome) {
      ec = write_ec;
      return false;
    }
  }
  if (!result.outcome) {
    ec = result.error;
    return false;
  }

  auto& outcome = *result.outcome;
  if (!apply_outcome(outcome, ec)) {
    sodium_memzero(outcome.key.data(), outcome.key.size());
    return false;
  }

  // Wait for the HOST's first sealed frame before trusting (and pinning) the key.
  frame::Frame confirm;
  OpenedFrame opened{};
  const bool confirmed =
      wait_frame(deadline, confirm, ec) && open_frame(confirm, opened.plaintext, ec);
  if (!confirmed) {
    sodium_memzero(outcome.key.data(), outcome.key.size());
    if (classify(ec) == ErrorKind::kCrypto) {
      ec = HandshakeError::kConfirmationFailed;
    }
    return false;
  }
  if (outcome.key_changed) {
    pin_key(outcome.key);
  }
  sodium_memzero(outcome.key.data(), outcome.key.size());

  if (outcome.mode == handshake::HelloMode::kResume &&
      !replay_unacknowledged(outcome.peer_next_recv_seq, ec)) {
    return false;
  }
  opened.type = confirm.type;
  first = std::move(opened);
  return true;
}

bool Session::apply_outcome(const handshake::HandshakeOutcome& outcome, std::error_code& ec) {
  GHOSTLINK_DCHECK_THREAD(thread_checker_);
  LOG_INFO("Handshake with {}: mode={}, session_id={}, key={}", peer_id_,
           handshake::to_string(outcome.mode), outcome.session_id,
           crypto::key_fingerprint(outcome.key));

  if (outcome.mode == handshake::HelloMode::kResume) {
    if (!envelope_ || !retransmit_.covers(outcome.peer_next_recv_seq)) {
      LOG_WARN("Cannot replay from seq {} (replay floor {}); next connection starts a new session",
               outcome.peer_next_recv_seq, retransmit_.replay_floor());
      resume_allowed_ = false;
      ec = TransportError::kClosed;
      return false;
    }
    LOG_INFO("Resuming session {} at send_seq={}, recv_seq={}", session_id_, send_seq_,
             recv_seq_);
    return true;
  }

  // Fresh key or new session on the pinned key: new traffic keys, counters from 0.
  if (have_session_) {
    report_dropped(transfers_.cancel_all());
  }
  report_undelivered();
  envelope_ = std::make_unique<crypto::CryptoEnvelope>(outcome.traffic);
  session_id_ = outcome.session_id;
  have_session_ = true;
  resume_allowed_ = true;
  reset_sequences();
  return true;
}

void Session::pin_key(const crypto::SessionKey& key) {
  std::error_code ec;
  if (!key_store_->put(peer_id_, key, ec)) {
    LOG_WARN("Could not persist key for '{}': {}", peer_id_, ec.message());
  }
}

bool Session::replay_unacknowledged(std::uint64_t peer_next_recv_seq, std::error_code& ec) {
  acknowledge(peer_next_recv_seq);
  const auto frames = retransmit_.frames_from(peer_next_recv_seq);
  if (!frames.empty()) {
    LOG_INFO("Replaying {} unacknowledged frame(s) from seq {}", frames.size(),
             peer_next_recv_seq);
  }
  for (const auto* pending : frames) {
    if (!write_wire(pending->wire, ec)) {
      return false;
    }
  }
  std::lock_guard lock(stats_mutex_);
  stats_.frames_replayed += frames.size();
  return true;
}

// ----------------------------------------------------------------------------
// Established traffic
// ----------------------------------------------------------------------------

Session::LinkOutcome Session::serve() {
  std::error_code ec;
  Event event;
  while (true) {
    if (stop_requested_) {
      send_bye();
      return LinkOutcome::kClosed;
    }

    if (rotate_requested_ && transfers_.idle() && pending_text_.empty() &&
        !retransmit_.has_unacknowledged_data()) {
      rotate_requested_ = false;
      LOG_INFO("Rotating key for {}", peer_id_);
      std::error_code store_ec;
      key_store_->forget(peer_id_, store_ec);
      if (store_ec) {
        LOG_WARN("Could not persist key removal for '{}': {}", peer_id_, store_ec.message());
      }
      have_session_ = false;
      return LinkOutcome::kReconnectNow;
    }

    if (!flush_outbound(ec)) {
      return outcome_for(ec, "send");
    }
    if (liveness_.ping_due() && !send_heartbeat(frame::FrameType::kPing, ec)) {
      return outcome_for(ec, "heartbeat");
    }

    switch (liveness_.status()) {
      case Liveness::kDead:
        LOG_WARN("Nothing from {} for {} heartbeat intervals", peer_id_,
                 config_.heartbeat.reconnect_after);
        return LinkOutcome::kReconnect;
      case Liveness::kDegraded:
        if (state() == SessionState::kEstablished) {
          set_state(SessionState::kDegraded);
        }
        break;
      case Liveness::kAlive:
        if (state() == SessionState::kDegraded) {
          set_state(SessionState::kEstablished);
        }
        break;
    }

    report_dropped(transfers_.expire());

    auto deadline = liveness_.next_deadline();
    if (const auto expiry = transfers_.next_expiry()) {
      deadline = std::min(deadline, *expiry);
    }
    if (!pop_event(deadline, event)) {
      continue;
    }

    if (event.kind == Event::Kind::kStreamError) {
      return outcome_for(event.error, "receive");
    }
    if (event.kind != Event::Kind::kFrame) {
      handle_command(event);
      continue;
    }

    std::vector<std::uint8_t> plaintext;
    if (!open_frame(event.frame, plaintext, ec)) {
      return outcome_for(ec, "receive");
    }
    bool bye = false;
    if (!dispatch(event.frame.type, std::move(plaintext), bye, ec)) {
      return outcome_for(ec, "receive");
    }
    if (bye) {
      return LinkOutcome::kClosed;
    }
  }
}

bool Session::wait_frame(TimePoint deadline, frame::Frame& out, std::error_code& ec) {
  Event event;
  while (!stop_requested_) {
    if (!pop_event(deadline, event)) {
      if (!stop_requested_ && now_fn_() >= deadline) {
        ec = HandshakeError::kTimeout;
        return false;
      }
      continue;
    }
    switch (event.kind) {
      case Event::Kind::kFrame:
        out = std::move(event.frame);
        return true;
      case Event::Kind::kStreamError:
        ec = event.error;
        return false;
      default:
        handle_command(event);
        break;
    }
  }
  ec = TransportError::kCancelled;
  return false;
}

bool Session::pop_event(TimePoint deadline, Event& out) {
  std::unique_lock lock(queue_mutex_);
  queue_cv_.wait_for(lock, deadline - now_fn_(),
                     [&] { return !events_.empty() || stop_requested_.load(); });
  if (events_.empty()) {
    return false;
  }
  out = std::move(events_.front());
  events_.pop_front();
  if (out.kind == Event::Kind::kFrame) {
    --queued_frames_;
    lock.unlock();
    space_cv_.notify_all();
  }
  return true;
}

void Session::handle_command(Event& event) {
  switch (event.kind) {
    case Event::Kind::kSendText: {
      const auto single_frame =
          crypto::CryptoEnvelope::max_plaintext(config_.transfer.max_frame_payload);
      if (event.text.size() <= single_frame) {
        pending_text_.push_back(std::move(event.text));
        break;
      }
      std::vector<std::uint8_t> bytes(event.text.begin(), event.text.end());
      std::error_code ec;
      if (!transfers_.enqueue(frame::PayloadKind::kText, std::move(bytes), ec)) {
        surface_error(ec, "text message too large");
      }
      break;
    }
    case Event::Kind::kSendMedia: {
      std::error_code ec;
      if (!transfers_.enqueue(frame::PayloadKind::kMedia, std::move(event.bytes), ec)) {
        surface_error(ec, "media too large");
      }
      break;
    }
    case Event::Kind::kRotateKey:
      LOG_INFO("Key rotation requested; waiting for in-flight data to be acknowledged");
      rotate_requested_ = true;
      break;
    case Event::Kind::kDropLink:
      if (stream_) {
        LOG_WARN("Dropping link to {} on request", peer_id_);
        stream_->close();
      }
      break;
    case Event::Kind::kFrame:
    case Event::Kind::kStreamError:
    case Event::Kind::kWake:
      break;
  }
}

bool Session::open_frame(const frame::Frame& frame, std::vector<std::uint8_t>& plaintext,
                         std::error_code& ec) {
  GHOSTLINK_DCHECK_THREAD(thread_checker_);
  if (!frame::is_sealed_type(frame.type) || frame.sequence != recv_seq_) {
    LOG_WARN("Expected seq {} from {}, got {} seq={}", recv_seq_, peer_id_,
             frame::to_string(frame.type), frame.sequence);
    ec = FrameError::kSequenceGap;
    return false;
  }
  if (!envelope_) {
    ec = CryptoError::kNoKey;
    return false;
  }
  CryptoError error{};
  auto opened =
      envelope_->open(static_cast<std::uint8_t>(frame.type), frame.sequence, frame.payload, error);
  if (!opened) {
    ec = error;
    return false;
  }

  ++recv_seq_;
  liveness_.on_frame_received();
  {
    std::lock_guard lock(stats_mutex_);
    ++stats_.frames_received;
    stats_.bytes_received += frame::FrameCodec::encoded_size(frame.payload.size());
  }
  update_sequence_stats();
  LOG_TRACE("Received {} seq={} ({} bytes)", frame::to_string(frame.type), frame.sequence,
            opened->size());
  plaintext = std::move(*opened);
  return true;
}

bool Session::dispatch(frame::FrameType type, std::vector<std::uint8_t> plaintext, bool& bye,
                       std::error_code& ec) {
  switch (type) {
    case frame::FrameType::kDataText: {
      std::string text(plaintext.begin(), plaintext.end());
      {
        std::lock_guard lock(stats_mutex_);
        ++stats_.messages_delivered;
      }
      if (on_message_) {
        on_message_(text);
      }
      return true;
    }

    case frame::FrameType::kDataChunk: {
      auto chunk = frame::decode_chunk_body(plaintext);
      if (!chunk) {
        LOG_WARN("Undecodable DATA_CHUNK body ({} bytes)", plaintext.size());
        {
          std::lock_guard lock(stats_mutex_);
          ++stats_.transfers_failed;
        }
        surface_error(make_error_code(TransferError::kMalformedChunk), "undecodable chunk header");
        return true;
      }
      auto result = transfers_.on_chunk(*chunk);
      if (result.should_ack()) {
        const frame::ChunkAckBody ack{
            .transfer_id = chunk->transfer_id,
            .index = chunk->index,
            .next_recv_seq = recv_seq_,
        };
        if (!send_sealed(frame::FrameType::kChunkAck, frame::encode_chunk_ack_body(ack), ec)) {
          return false;
        }
      }
      if (result.error) {
        {
          std::lock_guard lock(stats_mutex_);
          ++stats_.transfers_failed;
        }
        surface_error(result.error, "transfer " + std::to_string(chunk->transfer_id) + ": " +
                                        result.error.message());
      }
      if (result.completed) {
        deliver(std::move(*result.completed));
      }
      return true;
    }

    case frame::FrameType::kChunkAck: {
      const auto ack = frame::decode_chunk_ack_body(plaintext);
      if (!ack) {
        ec = FrameError::kLengthMismatch;
        return false;
      }
      acknowledge(ack->next_recv_seq);
      if (const auto done = transfers_.on_chunk_ack(*ack)) {
        LOG_DEBUG("Transfer {} delivered to {}", *done, peer_id_);
      }
      return true;
    }

    case frame::FrameType::kPing:
    case frame::FrameType::kPong: {
      const auto heartbeat = frame::decode_heartbeat_body(plaintext);
      if (!heartbeat) {
        ec = FrameError::kLengthMismatch;
        return false;
      }
      acknowledge(heartbeat->next_recv_seq);
      if (type == frame::FrameType::kPing) {
        return send_heartbeat(frame::FrameType::kPong, ec);
      }
      return true;
    }

    case frame::FrameType::kBye:
      LOG_INFO("Peer {} said BYE", peer_id_);
      bye = true;
      return true;

    case frame::FrameType::kHello:
    case frame::FrameType::kHelloAck:
      break;
  }
  ec = FrameError::kUnknownType;
  return false;
}

bool Session::flush_outbound(std::error_code& ec) {
  // A text or chunk leaves its queue as soon as it has a sequence number; if
  // the write fails it is still replayed from the retransmit buffer.
  bool ok = true;
  while (!pending_text_.empty()) {
    const auto text = std::move(pending_text_.front());
    pending_text_.pop_front();
    ok &= send_sealed(frame::FrameType::kDataText, as_bytes(text), ec);
  }
  for (const auto& chunk : transfers_.poll_outbound()) {
    ok &= send_sealed(frame::FrameType::kDataChunk, frame::encode_chunk_body(chunk), ec);
  }
  return ok;
}

bool Session::send_sealed(frame::FrameType type, std::span<const std::uint8_t> plaintext,
                          std::error_code& ec) {
  GHOSTLINK_DCHECK_THREAD(thread_checker_);
  const auto sequence = send_seq_++;
  const auto sealed = envelope_->seal(static_cast<std::uint8_t>(type), sequence, plaintext);
  auto wire = frame::FrameCodec::encode(type, sequence, sealed);
  LOG_TRACE("Sending {} seq={} ({} bytes)", frame::to_string(type), sequence, wire.size());

  // Once a write has failed the link is gone; later frames are only buffered.
  const bool written = !ec && write_wire(wire, ec);
  retransmit_.insert(sequence, type, std::move(wire));
  update_sequence_stats();
  return written;
}

bool Session::send_heartbeat(frame::FrameType type, std::error_code& ec) {
  const frame::HeartbeatBody body{.next_recv_seq = recv_seq_, .timestamp_ms = wall_clock_ms()};
  if (type == frame::FrameType::kPing) {
    liveness_.on_ping_sent();
  }
  return send_sealed(type, frame::encode_heartbeat_body(body), ec);
}

bool Session::write_wire(std::span<const std::uint8_t> wire, std::error_code& ec) {
  if (!stream_) {
    ec = TransportError::kClosed;
    return false;
  }
  if (!stream_->write(wire, ec)) {
    return false;
  }
  std::lock_guard lock(stats_mutex_);
  ++stats_.frames_sent;
  stats_.bytes_sent += wire.size();
  return true;
}

void Session::send_bye() {
  if (!stream_ || !envelope_) {
    return;
  }
  const std::array<std::uint8_t, 1> body{static_cast<std::uint8_t>(frame::ByeReason::kNormal)};
  std::error_code ec;
  if (!send_sealed(frame::FrameType::kBye, body, ec)) {
    LOG_DEBUG("BYE not delivered: {}", ec.message());
  }
}

void Session::acknowledge(std::uint64_t peer_next_recv_seq) {
  if (peer_next_recv_seq > send_seq_) {
    LOG_WARN("Peer acknowledged seq {} but only {} frames were sent", peer_next_recv_seq,
             send_seq_);
    return;
  }
  retransmit_.acknowledge_cumulative(peer_next_recv_seq);
}

void Session::reset_sequences() {
  send_seq_ = 0;
  recv_seq_ = 0;
  retransmit_.clear();
  update_sequence_stats();
}

void Session::deliver(transfer::CompletedTransfer completed) {
  if (completed.kind == frame::PayloadKind::kText) {
    std::string text(completed.data.begin(), completed.data.end());
    {
      std::lock_guard lock(stats_mutex_);
      ++stats_.messages_delivered;
    }
    if (on_message_) {
      on_message_(text);
    }
    return;
  }

  const auto mime = media::sniff_mime(completed.data);
  LOG_INFO("Received media from {}: {} bytes ({})", peer_id_, completed.data.size(), mime);
  {
    std::lock_guard lock(stats_mutex_);
    ++stats_.media_delivered;
  }
  if (on_media_) {
    on_media_(completed.data, mime);
  }
}

void Session::report_undelivered() {
  for (const auto sequence : retransmit_.unacknowledged(frame::FrameType::kDataText)) {
    LOG_WARN("Message seq {} to {} was never acknowledged; discarding it", sequence, peer_id_);
    surface_error(make_error_code(TransportError::kUndelivered),
                  "message seq " + std::to_string(sequence) + " to " + peer_id_ +
                      " was not delivered");
  }
}

void Session::report_dropped(const std::vector<transfer::DroppedTransfer>& dropped) {
  for (const auto& transfer : dropped) {
    {
      std::lock_guard lock(stats_mutex_);
      ++stats_.transfers_failed;
    }
    const char* direction =
        transfer.direction == transfer::TransferDirection::kInbound ? "inbound" : "outbound";
    surface_error(transfer.reason, std::string(direction) + " transfer " +
                                       std::to_string(transfer.transfer_id) + ": " +
                                       transfer.reason.message());
  }
}

// ----------------------------------------------------------------------------
// State and reporting
// ----------------------------------------------------------------------------

void Session::set_state(SessionState new_state) {
  SessionState old_state{};
  {
    std::lock_guard lock(state_mutex_);
    old_state = state_.exchange(new_state);
  }
  state_cv_.notify_all();
  if (old_state == new_state) {
    return;
  }
  LOG_INFO("Session state: {} -> {}", to_string(old_state), to_string(new_state));
  if (on_state_change_) {
    on_state_change_(old_state, new_state);
  }
}

void Session::surface_error(const std::error_code& ec, const std::string& detail) {
  surface_error(classify(ec), ec, detail);
}

void Session::surface_error(ErrorKind kind, const std::error_code& ec, const std::string& detail) {
  if (on_error_) {
    on_error_(kind, ec, detail);
  }
}

void Session::update_sequence_stats() {
  std::lock_guard lock(stats_mutex_);
  stats_.session_id = session_id_;
  stats_.next_send_seq = send_seq_;
  stats_.next_recv_seq = recv_seq_;
}

}  // namespace ghostlink::transport
