/**
 * End-to-end session tests
 *
 * Two Session instances talk over socketpair() links that stand in for an
 * RFCOMM channel. Every (re)connect creates a fresh socketpair, so dropped
 * links, corrupted frames and reconnects exercise the same code paths as a
 * real radio link:
 *
 * CLIENT send_text -> seal -> frame -> socket -> reassemble -> open -> HOST on_message
 */

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/auth/peer_key_store.h"
#include "common/crypto/crypto_engine.h"
#include "common/errors/error.h"
#include "transport/frame/frame.h"
#include "transport/frame/frame_codec.h"
#include "transport/session/session.h"
#include "transport/stream/fd_stream.h"
#include "transport/stream/tcp_connector.h"

namespace ghostlink::integration_tests {

using namespace std::chrono_literals;
using transport::Role;
using transport::Session;
using transport::SessionState;

namespace {

// Counters and one-shot faults applied to the frames one side writes.
struct WireTap {
  std::atomic<bool> corrupt_next_text{false};
  // Flips a ciphertext bit and recomputes the digest; only the AEAD tag can tell.
  std::atomic<bool> tamper_next_text{false};
  // DATA_TEXT frames reported as written but never put on the wire.
  std::atomic<int> swallow_texts{0};
  // The write of this DATA_CHUNK (1-based) fails and closes the stream.
  std::atomic<int> fail_at_chunk{0};
  // Runs just before the failing chunk write; set it before fail_at_chunk.
  std::function<void()> on_fail;
  std::atomic<int> text_frames{0};
  std::atomic<int> chunk_frames{0};

  std::atomic<int> streams{0};
  std::atomic<int> held_stream{-1};

  // Writes on the newest stream are held back until release(); later streams pass.
  void hold_current() { held_stream = streams.load() - 1; }
  void release() { held_stream = -1; }
};

// Relies on the session writing each frame with a single write() call.
class TappedStream final : public transport::ByteStream {
 public:
  TappedStream(std::unique_ptr<transport::ByteStream> inner, std::shared_ptr<WireTap> tap)
      : inner_(std::move(inner)), tap_(std::move(tap)), index_(tap_->streams++) {}

  std::size_t read(std::span<std::uint8_t> buffer, std::error_code& ec) override {
    return inner_->read(buffer, ec);
  }

  bool write(std::span<const std::uint8_t> data, std::error_code& ec) override {
    if (tap_->held_stream == index_) {
      held_.emplace_back(data.begin(), data.end());
      return true;
    }
    for (const auto& frame : held_) {
      if (!inner_->write(frame, ec)) {
        return false;
      }
    }
    held_.clear();

    if (data.size() > frame::kHeaderSize) {
      const auto type = static_cast<frame::FrameType>(data[3]);
      if (type == frame::FrameType::kDataChunk) {
        if (++tap_->chunk_frames == tap_->fail_at_chunk) {
          if (tap_->on_fail) {
            tap_->on_fail();
          }
          inner_->close();
          ec = TransportError::kClosed;
          return false;
        }
      }
      if (type == frame::FrameType::kDataText) {
        ++tap_->text_frames;
        if (tap_->swallow_texts > 0) {
          --tap_->swallow_texts;
          return true;
        }
        if (tap_->corrupt_next_text.exchange(false)) {
          std::vector<std::uint8_t> damaged(data.begin(), data.end());
          damaged[frame::kHeaderSize] ^= 0x01;
          return inner_->write(damaged, ec);
        }
        if (tap_->tamper_next_text.exchange(false)) {
          return inner_->write(forge(data), ec);
        }
      }
    }
    return inner_->write(data, ec);
  }

  void close() override { inner_->close(); }
  std::string peer_address() const override { return inner_->peer_address(); }

 private:
  // Same frame with one ciphertext bit flipped and a valid digest.
  static std::vector<std::uint8_t> forge(std::span<const std::uint8_t> data) {
    FrameError error{};
    auto decoded = frame::FrameCodec::decode(data, error);
    EXPECT_TRUE(decoded.has_value());
    if (!decoded) {
      return {data.begin(), data.end()};
    }
    // Skip the 12-byte nonce.
    decoded->payload.at(12) ^= 0x01;
    return frame::FrameCodec::encode(decoded->type, decoded->sequence, decoded->payload);
  }

  std::unique_ptr<transport::ByteStream> inner_;
  std::shared_ptr<WireTap> tap_;
  const int index_;
  std::vector<std::vector<std::uint8_t>> held_;
};

// A simulated point-to-point link. Each dial creates a socketpair; the HOST
// end waits until the HOST connector accepts it.
class LoopbackLink {
 public:
  std::unique_ptr<transport::ByteStream> dial(std::error_code& ec) {
    if (refuse_dials) {
      ec = TransportError::kIoFault;
      return nullptr;
    }
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
      ec = std::error_code(errno, std::generic_category());
      return nullptr;
    }
    auto host_end = std::make_unique<TappedStream>(
        std::make_unique<transport::FdByteStream>(fds[0], "client-1"), host_tap);
    {
      std::lock_guard lock(mutex_);
      // A newer dial supersedes one the HOST never picked up.
      pending_.clear();
      pending_.push_back(std::move(host_end));
    }
    cv_.notify_all();
    return std::make_unique<TappedStream>(
        std::make_unique<transport::FdByteStream>(fds[1], "host-1"), client_tap);
  }

  std::unique_ptr<transport::ByteStream> accept(std::chrono::milliseconds timeout,
                                                const std::atomic<bool>& cancelled,
                                                std::error_code& ec) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !pending_.empty() || cancelled.load(); });
    if (cancelled) {
      ec = TransportError::kCancelled;
      return nullptr;
    }
    if (pending_.empty()) {
      ec = TransportError::kTimeout;
      return nullptr;
    }
    auto stream = std::move(pending_.front());
    pending_.pop_front();
    return stream;
  }

  void wake() {
    std::lock_guard lock(mutex_);
    cv_.notify_all();
  }

  std::shared_ptr<WireTap> host_tap = std::make_shared<WireTap>();
  std::shared_ptr<WireTap> client_tap = std::make_shared<WireTap>();
  // While set, the CLIENT cannot reach the HOST at all.
  std::atomic<bool> refuse_dials{false};

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<transport::ByteStream>> pending_;
};

class LinkHostConnector final : public transport::StreamConnector {
 public:
  explicit LinkHostConnector(LoopbackLink& link) : link_(link) {}

  std::unique_ptr<transport::ByteStream> open(std::chrono::milliseconds timeout,
                                              std::error_code& ec) override {
    return link_.accept(timeout, cancelled_, ec);
  }

  void cancel() override {
    cancelled_ = true;
    link_.wake();
  }

 private:
  LoopbackLink& link_;
  std::atomic<bool> cancelled_{false};
};

class LinkClientConnector final : public transport::StreamConnector {
 public:
  explicit LinkClientConnector(LoopbackLink& link) : link_(link) {}

  std::unique_ptr<transport::ByteStream> open(std::chrono::milliseconds /*timeout*/,
                                              std::error_code& ec) override {
    if (cancelled_) {
      ec = TransportError::kCancelled;
      return nullptr;
    }
    return link_.dial(ec);
  }

  void cancel() override { cancelled_ = true; }

 private:
  LoopbackLink& link_;
  std::atomic<bool> cancelled_{false};
};

// Connector whose peer never answers.
class UnreachableConnector final : public transport::StreamConnector {
 public:
  std::unique_ptr<transport::ByteStream> open(std::chrono::milliseconds /*timeout*/,
                                              std::error_code& ec) override {
    ec = TransportError::kIoFault;
    return nullptr;
  }
  void cancel() override {}
};

// Everything a session reported through its callbacks.
struct Recorder {
  mutable std::mutex mutex;
  std::vector<std::string> messages;
  std::vector<std::vector<std::uint8_t>> media;
  std::vector<std::string> mimes;
  std::vector<SessionState> states;
  std::vector<ErrorKind> errors;
  std::vector<std::error_code> codes;

  void attach(Session& session) {
    session.on_message([this](const std::string& text) {
      std::lock_guard lock(mutex);
      messages.push_back(text);
    });
    session.on_media([this](const std::vector<std::uint8_t>& bytes, const std::string& mime) {
      std::lock_guard lock(mutex);
      media.push_back(bytes);
      mimes.push_back(mime);
    });
    session.on_state_change([this](SessionState /*old_state*/, SessionState new_state) {
      std::lock_guard lock(mutex);
      states.push_back(new_state);
    });
    session.on_error([this](ErrorKind kind, const std::error_code& ec,
                            const std::string& /*detail*/) {
      std::lock_guard lock(mutex);
      errors.push_back(kind);
      codes.push_back(ec);
    });
  }

  std::size_t message_count() const {
    std::lock_guard lock(mutex);
    return messages.size();
  }

  std::size_t media_count() const {
    std::lock_guard lock(mutex);
    return media.size();
  }

  bool saw_state(SessionState state) const {
    std::lock_guard lock(mutex);
    return std::find(states.begin(), states.end(), state) != states.end();
  }

  bool saw_error(ErrorKind kind) const {
    std::lock_guard lock(mutex);
    return std::find(errors.begin(), errors.end(), kind) != errors.end();
  }

  std::size_t error_count(const std::error_code& code) const {
    std::lock_guard lock(mutex);
    return static_cast<std::size_t>(std::count(codes.begin(), codes.end(), code));
  }
};

// steady_clock shifted by an offset the test can move forward.
struct SkewedClock {
  std::atomic<std::int64_t> offset_ms{0};

  Session::TimePoint now() const {
    return Session::Clock::now() + std::chrono::milliseconds(offset_ms.load());
  }
  void advance(std::chrono::milliseconds by) { offset_ms += by.count(); }
};

bool between_connections(const Session& session) {
  const auto state = session.state();
  return state == SessionState::kReconnecting || state == SessionState::kConnecting;
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return condition();
}

transport::SessionConfig make_config(Role role) {
  transport::SessionConfig config{};
  config.role = role;
  config.connect_timeout = 2000ms;
  config.handshake_timeout = 2000ms;
  config.heartbeat.heartbeat_interval = 100ms;
  config.reconnect.base_delay = 50ms;
  config.reconnect.max_delay = 200ms;
  config.reconnect.jitter = 0.0;
  config.reconnect.max_attempts = 0;
  config.pairing_secret = {'p', 'a', 'i', 'r'};
  return config;
}

std::vector<std::uint8_t> fake_png(std::size_t size) {
  std::vector<std::uint8_t> image(size);
  for (std::size_t i = 0; i < size; ++i) {
    image[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 8));
  }
  const std::uint8_t signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  std::copy(std::begin(signature), std::end(signature), image.begin());
  return image;
}

}  // namespace

/**
 * Fixture with a HOST and a CLIENT session on one LoopbackLink, each with its
 * own in-memory key store. Both read time from one SkewedClock. Derived
 * fixtures adjust host_config_ / client_config_ in their constructor.
 */
class SessionIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    host_keys_ = std::make_shared<auth::PeerKeyStore>();
    client_keys_ = std::make_shared<auth::PeerKeyStore>();
    auto now_fn = [clock = clock_] { return clock->now(); };
    host_ = std::make_unique<Session>(host_config_, std::make_unique<LinkHostConnector>(link_),
                                      host_keys_, now_fn);
    client_ = std::make_unique<Session>(client_config_,
                                        std::make_unique<LinkClientConnector>(link_), client_keys_,
                                        now_fn);
    host_events_.attach(*host_);
    client_events_.attach(*client_);
  }

  void TearDown() override {
    client_->disconnect();
    host_->disconnect();
  }

  void establish() {
    std::error_code ec;
    ASSERT_TRUE(host_->listen(ec)) << ec.message();
    ASSERT_TRUE(client_->connect("host-1", ec)) << ec.message();
    ASSERT_TRUE(wait_until([&] {
      return host_->state() == SessionState::kEstablished &&
             client_->state() == SessionState::kEstablished;
    })) << "host=" << transport::to_string(host_->state())
        << " client=" << transport::to_string(client_->state());
  }

  // Both sides went through RECONNECTING and are ESTABLISHED again.
  bool reestablished() const {
    return host_events_.saw_state(SessionState::kReconnecting) &&
           client_events_.saw_state(SessionState::kReconnecting) &&
           host_->state() == SessionState::kEstablished &&
           client_->state() == SessionState::kEstablished;
  }

  LoopbackLink link_;
  std::shared_ptr<SkewedClock> clock_ = std::make_shared<SkewedClock>();
  transport::SessionConfig host_config_ = make_config(Role::kHost);
  transport::SessionConfig client_config_ = make_config(Role::kClient);
  std::shared_ptr<auth::PeerKeyStore> host_keys_;
  std::shared_ptr<auth::PeerKeyStore> client_keys_;
  Recorder host_events_;
  Recorder client_events_;
  std::unique_ptr<Session> host_;
  std::unique_ptr<Session> client_;
};

TEST_F(SessionIntegrationTest, HandshakeEstablishesAndPinsSameKey) {
  establish();

  EXPECT_TRUE(host_events_.saw_state(SessionState::kConnecting));
  EXPECT_TRUE(host_events_.saw_state(SessionState::kHandshaking));
  EXPECT_EQ(host_->peer_id(), "client-1");
  EXPECT_EQ(client_->peer_id(), "host-1");

  const auto host_key = host_keys_->get("client-1");
  const auto client_key = client_keys_->get("host-1");
  ASSERT_TRUE(host_key.has_value());
  ASSERT_TRUE(client_key.has_value());
  EXPECT_EQ(*host_key, *client_key);
  EXPECT_EQ(host_->stats().session_id, client_->stats().session_id);
}

TEST_F(SessionIntegrationTest, TextDeliveredExactlyOnce) {
  establish();

  std::error_code ec;
  ASSERT_TRUE(client_->send_text("hello world", ec));
  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() >= 1; }));
  std::this_thread::sleep_for(200ms);

  std::lock_guard lock(host_events_.mutex);
  ASSERT_EQ(host_events_.messages.size(), 1U);
  EXPECT_EQ(host_events_.messages[0], "hello world");
}

TEST_F(SessionIntegrationTest, MessagesArriveInOrderBothWays) {
  establish();

  std::error_code ec;
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(client_->send_text("c" + std::to_string(i), ec));
    ASSERT_TRUE(host_->send_text("h" + std::to_string(i), ec));
  }
  ASSERT_TRUE(wait_until([&] {
    return host_events_.message_count() == 20 && client_events_.message_count() == 20;
  }));

  std::lock_guard host_lock(host_events_.mutex);
  std::lock_guard client_lock(client_events_.mutex);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(host_events_.messages[i], "c" + std::to_string(i));
    EXPECT_EQ(client_events_.messages[i], "h" + std::to_string(i));
  }
}

TEST_F(SessionIntegrationTest, FiveHundredKiBImageTravelsAsEightChunks) {
  establish();

  const auto image = fake_png(500 * 1024);
  std::error_code ec;
  ASSERT_TRUE(host_->send_media(image, ec)) << ec.message();
  ASSERT_TRUE(wait_until([&] { return client_events_.media_count() == 1; }));

  EXPECT_EQ(link_.host_tap->chunk_frames.load(), 8);
  std::lock_guard lock(client_events_.mutex);
  EXPECT_EQ(client_events_.media[0], image);
  EXPECT_EQ(client_events_.mimes[0], "image/png");
}

TEST_F(SessionIntegrationTest, OversizeMediaRejectedUpFront) {
  establish();

  std::error_code ec;
  EXPECT_FALSE(client_->send_media(std::vector<std::uint8_t>((64U << 20) + 1, 0), ec));
  EXPECT_EQ(ec, TransferError::kTooLarge);
}

TEST_F(SessionIntegrationTest, DroppedLinkResumesWithContinuousSequence) {
  establish();

  std::error_code ec;
  ASSERT_TRUE(client_->send_text("before", ec));
  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() == 1; }));

  const auto session_id = client_->stats().session_id;
  const auto sent_before = client_->stats().next_send_seq;
  const auto received_before = host_->stats().next_recv_seq;
  ASSERT_GT(sent_before, 0U);

  host_->drop_link();
  ASSERT_TRUE(wait_until([&] { return reestablished(); }));

  ASSERT_TRUE(client_->send_text("after", ec));
  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() == 2; }));

  // Same session, counters carried on rather than restarted.
  EXPECT_EQ(client_->stats().session_id, session_id);
  EXPECT_EQ(host_->stats().session_id, session_id);
  EXPECT_GT(client_->stats().next_send_seq, sent_before);
  EXPECT_GT(host_->stats().next_recv_seq, received_before);
  EXPECT_GE(host_->stats().reconnect_count, 1U);

  std::lock_guard lock(host_events_.mutex);
  EXPECT_EQ(host_events_.messages, (std::vector<std::string>{"before", "after"}));
}

TEST_F(SessionIntegrationTest, CorruptedFrameTriggersReconnectAndReplay) {
  establish();

  link_.client_tap->corrupt_next_text = true;
  std::error_code ec;
  ASSERT_TRUE(client_->send_text("hello world", ec));

  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() >= 1 && reestablished(); }));
  std::this_thread::sleep_for(200ms);

  const auto stats = host_->stats();
  EXPECT_GE(stats.frame_errors, 1U);
  EXPECT_EQ(stats.last_frame_error, FrameError::kBadDigest);
  EXPECT_GE(client_->stats().frames_replayed, 1U);
  // Frame errors are handled by reconnecting, not surfaced.
  EXPECT_FALSE(host_events_.saw_error(ErrorKind::kFrame));

  std::lock_guard lock(host_events_.mutex);
  ASSERT_EQ(host_events_.messages.size(), 1U);
  EXPECT_EQ(host_events_.messages[0], "hello world");
}

TEST_F(SessionIntegrationTest, TextQueuedWhileReconnectingIsSentAfterResume) {
  establish();

  host_->drop_link();
  std::error_code ec;
  ASSERT_TRUE(client_->send_text("queued", ec));

  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() == 1; }));
  std::lock_guard lock(host_events_.mutex);
  EXPECT_EQ(host_events_.messages[0], "queued");
}

TEST_F(SessionIntegrationTest, DisconnectSendsByeAndPeerCloses) {
  establish();

  client_->disconnect();
  EXPECT_EQ(client_->state(), SessionState::kClosed);
  EXPECT_TRUE(host_->wait_for_state(SessionState::kClosed, 5s))
      << transport::to_string(host_->state());

  std::error_code ec;
  EXPECT_FALSE(host_->send_text("too late", ec));
  EXPECT_EQ(ec, TransportError::kClosed);
  EXPECT_FALSE(host_->listen(ec));
}

TEST_F(SessionIntegrationTest, RotateKeyNegotiatesNewSession) {
  establish();

  const auto old_key = host_keys_->get("client-1");
  const auto old_session = host_->stats().session_id;
  ASSERT_TRUE(old_key.has_value());

  std::error_code ec;
  ASSERT_TRUE(host_->rotate_key(ec));
  ASSERT_TRUE(wait_until([&] {
    const auto key = host_keys_->get("client-1");
    return key && *key != *old_key && host_->state() == SessionState::kEstablished &&
           client_->state() == SessionState::kEstablished;
  }));

  EXPECT_NE(host_->stats().session_id, old_session);
  EXPECT_EQ(host_keys_->get("client-1"), client_keys_->get("host-1"));

  ASSERT_TRUE(client_->send_text("after rotation", ec));
  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() == 1; }));
}

TEST_F(SessionIntegrationTest, SecondStartRejected) {
  establish();

  std::error_code ec;
  EXPECT_FALSE(client_->connect("host-1", ec));
  EXPECT_EQ(ec, std::errc::operation_in_progress);
  EXPECT_FALSE(client_->listen(ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(SessionIntegrationTest, ImageSurvivesOutageLongerThanTransferTimeout) {
  establish();

  // The fifth chunk write kills the link and keeps the CLIENT from redialling.
  link_.client_tap->on_fail = [this] { link_.refuse_dials = true; };
  link_.client_tap->fail_at_chunk = 5;

  const auto image = fake_png(500 * 1024);
  std::error_code ec;
  ASSERT_TRUE(client_->send_media(image, ec)) << ec.message();

  ASSERT_TRUE(wait_until([&] {
    return link_.refuse_dials && between_connections(*host_) && between_connections(*client_);
  }));
  // The outage lasts longer than the transfer timeout.
  clock_->advance(client_config_.transfer.transfer_timeout + 1000ms);
  link_.refuse_dials = false;

  ASSERT_TRUE(wait_until([&] { return host_events_.media_count() == 1; }, 10s));
  EXPECT_GE(client_->stats().frames_replayed, 1U);
  EXPECT_EQ(host_->stats().transfers_failed, 0U);
  EXPECT_EQ(client_->stats().transfers_failed, 0U);
  EXPECT_FALSE(host_events_.saw_error(ErrorKind::kTransfer));
  EXPECT_FALSE(client_events_.saw_error(ErrorKind::kTransfer));

  std::lock_guard lock(host_events_.mutex);
  EXPECT_EQ(host_events_.media[0], image);
}

TEST_F(SessionIntegrationTest, TamperedCiphertextDisconnectsWithCryptoError) {
  establish();

  link_.client_tap->tamper_next_text = true;
  std::error_code ec;
  ASSERT_TRUE(client_->send_text("secret", ec));

  ASSERT_TRUE(host_->wait_for_state(SessionState::kDisconnected, 5s))
      << transport::to_string(host_->state());
  EXPECT_TRUE(host_events_.saw_error(ErrorKind::kCrypto));
  EXPECT_EQ(host_events_.message_count(), 0U);

  const auto stats = host_->stats();
  EXPECT_GE(stats.crypto_errors, 1U);
  // The digest was valid, so this is not a frame error.
  EXPECT_EQ(stats.frame_errors, 0U);
}

TEST_F(SessionIntegrationTest, PinnedKeyMismatchDisconnectsBothSides) {
  crypto::SessionKey host_view{};
  host_view.fill(0x11);
  crypto::SessionKey client_view{};
  client_view.fill(0x22);
  std::error_code ec;
  ASSERT_TRUE(host_keys_->put("client-1", host_view, ec)) << ec.message();
  ASSERT_TRUE(client_keys_->put("host-1", client_view, ec)) << ec.message();

  ASSERT_TRUE(host_->listen(ec)) << ec.message();
  ASSERT_TRUE(client_->connect("host-1", ec)) << ec.message();

  ASSERT_TRUE(wait_until([&] {
    return host_->state() == SessionState::kDisconnected &&
           client_->state() == SessionState::kDisconnected;
  })) << "host=" << transport::to_string(host_->state())
      << " client=" << transport::to_string(client_->state());
  EXPECT_EQ(client_events_.error_count(HandshakeError::kKeyMismatch), 1U);
  EXPECT_EQ(host_events_.error_count(HandshakeError::kKeyMismatch), 1U);
  EXPECT_FALSE(host_events_.saw_state(SessionState::kEstablished));

  // A mismatch never overwrites what either side has pinned.
  EXPECT_EQ(host_keys_->get("client-1"), host_view);
  EXPECT_EQ(client_keys_->get("host-1"), client_view);
}

TEST_F(SessionIntegrationTest, RotationWaitsForUnacknowledgedText) {
  establish();

  std::error_code ec;
  ASSERT_TRUE(host_->send_text("before rotation", ec));
  ASSERT_TRUE(host_->rotate_key(ec));

  ASSERT_TRUE(wait_until([&] {
    return host_events_.saw_state(SessionState::kReconnecting) &&
           host_->state() == SessionState::kEstablished &&
           client_->state() == SessionState::kEstablished;
  }));
  EXPECT_EQ(host_events_.error_count(TransportError::kUndelivered), 0U);

  std::lock_guard lock(client_events_.mutex);
  EXPECT_EQ(client_events_.messages, (std::vector<std::string>{"before rotation"}));
}

TEST_F(SessionIntegrationTest, DisconnectFromCallbackClosesSession) {
  host_->on_message([this](const std::string& text) {
    if (text == "bye now") {
      host_->disconnect();
    }
  });
  establish();

  std::error_code ec;
  ASSERT_TRUE(client_->send_text("bye now", ec));
  EXPECT_TRUE(host_->wait_for_state(SessionState::kClosed, 5s))
      << transport::to_string(host_->state());
  EXPECT_TRUE(client_->wait_for_state(SessionState::kClosed, 5s))
      << transport::to_string(client_->state());

  // From outside the control thread this joins it.
  host_->disconnect();
  EXPECT_EQ(host_->state(), SessionState::kClosed);
}

/**
 * CLIENT with a replay buffer too small to cover a burst of messages, so a
 * resume after losing them is impossible.
 */
class SessionSmallReplayBufferTest : public SessionIntegrationTest {
 protected:
  SessionSmallReplayBufferTest() { client_config_.retransmit.max_pending_count = 3; }
};

TEST_F(SessionSmallReplayBufferTest, LostMessagesReportedWhenNewSessionStarts) {
  establish();
  const auto session_id = client_->stats().session_id;

  // None of these reach the HOST. The next heartbeat shows it a sequence gap,
  // and the CLIENT can no longer replay from where the HOST stopped.
  link_.client_tap->swallow_texts = 5;
  std::error_code ec;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(client_->send_text("lost " + std::to_string(i), ec));
  }

  ASSERT_TRUE(wait_until([&] {
    return client_events_.error_count(TransportError::kUndelivered) == 5 &&
           host_->state() == SessionState::kEstablished &&
           client_->state() == SessionState::kEstablished;
  }, 10s)) << "undelivered=" << client_events_.error_count(TransportError::kUndelivered);
  EXPECT_NE(client_->stats().session_id, session_id);
  EXPECT_GE(host_->stats().frame_errors, 1U);

  ASSERT_TRUE(client_->send_text("after reset", ec));
  ASSERT_TRUE(wait_until([&] { return host_events_.message_count() == 1; }));
  std::this_thread::sleep_for(200ms);

  EXPECT_EQ(client_events_.error_count(TransportError::kUndelivered), 5U);
  std::lock_guard lock(host_events_.mutex);
  EXPECT_EQ(host_events_.messages, (std::vector<std::string>{"after reset"}));
}

/**
 * CLIENT that tolerates a long silence before reconnecting, so DEGRADED can be
 * observed and left again.
 */
class SessionPatientLivenessTest : public SessionIntegrationTest {
 protected:
  SessionPatientLivenessTest() { client_config_.heartbeat.reconnect_after = 20; }
};

TEST_F(SessionPatientLivenessTest, SilenceDegradesThenRecoversOrReconnects) {
  establish();

  // Everything the HOST writes is held back for a while.
  link_.host_tap->hold_current();
  ASSERT_TRUE(client_->wait_for_state(SessionState::kDegraded, 3s))
      << transport::to_string(client_->state());
  link_.host_tap->release();
  ASSERT_TRUE(client_->wait_for_state(SessionState::kEstablished, 3s))
      << transport::to_string(client_->state());
  EXPECT_FALSE(client_events_.saw_state(SessionState::kReconnecting));

  // Held for good this time: DEGRADED gives way to RECONNECTING.
  link_.host_tap->hold_current();
  ASSERT_TRUE(
      wait_until([&] { return client_events_.saw_state(SessionState::kReconnecting); }, 5s));
  ASSERT_TRUE(wait_until([&] { return reestablished(); }, 5s));
  link_.host_tap->release();

  std::error_code ec;
  ASSERT_TRUE(host_->send_text("still here", ec));
  ASSERT_TRUE(wait_until([&] { return client_events_.message_count() == 1; }));
}

TEST(SessionLifecycleTests, SendBeforeStartFails) {
  Session session(make_config(Role::kClient), std::make_unique<UnreachableConnector>(), nullptr);
  std::error_code ec;
  EXPECT_FALSE(session.send_text("hi", ec));
  EXPECT_EQ(ec, TransportError::kClosed);
  EXPECT_FALSE(session.connect("not a valid id", ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
  EXPECT_EQ(session.state(), SessionState::kDisconnected);
}

TEST(SessionLifecycleTests, ReconnectAttemptsExhaustedCloses) {
  auto config = make_config(Role::kClient);
  config.reconnect.base_delay = 10ms;
  config.reconnect.max_delay = 20ms;
  config.reconnect.max_attempts = 2;

  Recorder events;
  Session session(config, std::make_unique<UnreachableConnector>(), nullptr);
  events.attach(session);

  std::error_code ec;
  ASSERT_TRUE(session.connect("host-1", ec));
  EXPECT_TRUE(session.wait_for_state(SessionState::kClosed, 5s));
  EXPECT_TRUE(events.saw_state(SessionState::kReconnecting));
  EXPECT_TRUE(wait_until([&] { return events.saw_error(ErrorKind::kFatal); }));
  EXPECT_EQ(session.stats().reconnect_count, 2U);
}

TEST(SessionTcpTests, LoopbackExchange) {
  auto listener = std::make_unique<transport::TcpListenConnector>("127.0.0.1", 0);
  std::error_code ec;
  if (!listener->listen(ec)) {
    GTEST_SKIP() << "TCP loopback unavailable: " << ec.message();
  }
  const auto port = listener->local_port();

  Recorder host_events;
  Session host(make_config(Role::kHost), std::move(listener), nullptr);
  Session client(make_config(Role::kClient),
                 std::make_unique<transport::TcpDialConnector>("127.0.0.1", port), nullptr);
  host_events.attach(host);

  ASSERT_TRUE(host.listen(ec)) << ec.message();
  ASSERT_TRUE(client.connect("127.0.0.1", ec)) << ec.message();
  ASSERT_TRUE(client.wait_for_state(SessionState::kEstablished, 5s));

  ASSERT_TRUE(client.send_text("hello world", ec));
  ASSERT_TRUE(wait_until([&] { return host_events.message_count() == 1; }));

  client.disconnect();
  EXPECT_TRUE(host.wait_for_state(SessionState::kClosed, 5s));
}

}  // namespace ghostlink::integration_tests
