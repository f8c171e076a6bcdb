#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "transport/frame/frame.h"

namespace ghostlink::transport {

struct RetransmitConfig {
  // Maximum bytes of sent-but-unacknowledged frames kept for resumption.
  std::size_t max_buffer_bytes{4U << 20};  // 4 MB
  // Maximum number of frames kept (0 = unlimited).
  std::size_t max_pending_count{4096};
};

// Entry representing an encoded frame awaiting acknowledgment.
struct PendingFrame {
  std::uint64_t sequence{0};
  frame::FrameType type{frame::FrameType::kPing};
  std::vector<std::uint8_t> wire;
};

/**
 * Keeps encoded frames that were written but not yet acknowledged by the peer,
 * so a resumed connection can replay them verbatim.
 *
 * Acknowledgement is cumulative: the peer reports the next sequence it expects
 * (in PING, PONG, CHUNK_ACK, HELLO and HELLO_ACK) and everything below it is
 * released. When a limit is hit the oldest frames are evicted; covers() then
 * reports that a resume from before the eviction point is impossible. Evicted
 * DATA_TEXT and DATA_CHUNK frames are still remembered by sequence until the
 * peer acknowledges them, so a session reset can tell what was lost.
 *
 * Thread Safety: not thread-safe; owned by the session control thread.
 */
class RetransmitBuffer {
 public:
  explicit RetransmitBuffer(RetransmitConfig config = {});

  // Track a sent frame. Sequences must be inserted in increasing order.
  void insert(std::uint64_t sequence, frame::FrameType type, std::vector<std::uint8_t> wire);

  // Release every frame with sequence < next_expected.
  void acknowledge_cumulative(std::uint64_t next_expected);

  // True if every frame from next_expected up to the last inserted one is still held.
  [[nodiscard]] bool covers(std::uint64_t next_expected) const;

  // Frames with sequence >= next_expected, oldest first.
  std::vector<const PendingFrame*> frames_from(std::uint64_t next_expected) const;

  // Sequences of unacknowledged frames of this type, held or evicted, oldest first.
  std::vector<std::uint64_t> unacknowledged(frame::FrameType type) const;

  // True while any DATA_TEXT or DATA_CHUNK frame awaits acknowledgement.
  [[nodiscard]] bool has_unacknowledged_data() const;

  void clear();

  // Lowest sequence that can still be replayed.
  std::uint64_t replay_floor() const { return floor_; }
  std::size_t buffered_bytes() const { return buffered_bytes_; }
  std::size_t pending_count() const { return pending_.size(); }

 private:
  void evict_oldest();

  RetransmitConfig config_;
  std::map<std::uint64_t, PendingFrame> pending_;
  // Data frames dropped by eviction that the peer has not acknowledged yet.
  std::map<std::uint64_t, frame::FrameType> evicted_data_;
  std::size_t buffered_bytes_{0};
  // Sequence just after the newest frame ever inserted.
  std::uint64_t next_sequence_{0};
  // Lowest sequence that may still be replayed; raised by acks and evictions.
  std::uint64_t floor_{0};
};

}  // namespace ghostlink::transport
