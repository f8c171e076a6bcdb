#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

#include "transport/frame/frame.h"

namespace ghostlink::transfer {

// Upper bound on chunks per transfer, independent of the size limit.
inline constexpr std::uint32_t kMaxChunksPerTransfer = 1U << 16;

struct TransferConfig {
  // Frame payload budget; chunk data is what remains after the envelope and chunk header.
  std::size_t max_frame_payload{frame::kMaxPayloadSize};
  // Unacknowledged chunks allowed in flight per outbound transfer.
  std::size_t window_chunks{4};
  // A transfer without progress for this long is discarded.
  std::chrono::milliseconds transfer_timeout{30000};
  // Largest payload accepted in either direction.
  std::size_t max_transfer_bytes{64U << 20};
  // Concurrent inbound transfers kept at once.
  std::size_t max_inbound_transfers{16};
};

struct CompletedTransfer {
  std::uint64_t transfer_id{0};
  frame::PayloadKind kind{frame::PayloadKind::kMedia};
  std::vector<std::uint8_t> data;
};

enum class TransferDirection : std::uint8_t { kInbound, kOutbound };

struct DroppedTransfer {
  std::uint64_t transfer_id{0};
  TransferDirection direction{TransferDirection::kInbound};
  std::error_code reason;
};

struct InboundResult {
  // Set when this chunk completed its transfer.
  std::optional<CompletedTransfer> completed;
  // Set when the chunk was rejected; the transfer it named has been dropped.
  std::error_code error;
  // The chunk was already received; it is still acknowledged.
  bool duplicate{false};

  bool should_ack() const { return !error; }
};

/**
 * Splits outbound payloads into DATA_CHUNK bodies and reassembles inbound ones.
 *
 * Outbound transfers keep at most window_chunks chunks unacknowledged; a
 * CHUNK_ACK opens a slot. Inbound chunks are routed by transfer_id, duplicates
 * are ignored, and a transfer is handed up exactly once when every index has
 * arrived. Transfers without progress for transfer_timeout are discarded.
 *
 * Thread Safety: not thread-safe; owned by the session control thread.
 */
class TransferManager {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit TransferManager(TransferConfig config = {},
                           std::function<TimePoint()> now_fn = Clock::now);

  // Bytes of payload carried by one DATA_CHUNK.
  std::size_t chunk_data_size() const { return chunk_data_size_; }
  static std::uint32_t chunk_count(std::size_t payload_size, std::size_t chunk_data_size);

  // Queue a payload for sending. Returns the transfer id, or nullopt with
  // error set when it exceeds max_transfer_bytes.
  std::optional<std::uint64_t> enqueue(frame::PayloadKind kind, std::vector<std::uint8_t> payload,
                                       std::error_code& error);

  // Chunks that may be sent now, oldest transfer first. They count against
  // the window from this call on.
  std::vector<frame::ChunkBody> poll_outbound();

  // Returns the transfer id when this ack completed an outbound transfer.
  std::optional<std::uint64_t> on_chunk_ack(const frame::ChunkAckBody& ack);

  InboundResult on_chunk(const frame::ChunkBody& chunk);

  // Drop transfers that made no progress within transfer_timeout.
  std::vector<DroppedTransfer> expire();

  // Drop everything (session teardown or key change).
  std::vector<DroppedTransfer> cancel_all();

  // Restart the idle timer of every transfer. Called when a dropped link has
  // been resumed: nothing could progress while it was down.
  void touch_all();

  // Earliest time at which expire() can drop something, if anything is pending.
  std::optional<TimePoint> next_expiry() const;

  [[nodiscard]] bool idle() const { return outbound_.empty() && inbound_.empty(); }

 private:
  struct Outbound {
    std::uint64_t transfer_id{0};
    frame::PayloadKind kind{frame::PayloadKind::kMedia};
    std::vector<std::uint8_t> payload;
    std::uint32_t total{0};
    std::uint32_t next_index{0};
    std::set<std::uint32_t> in_flight;
    std::uint32_t acked{0};
    TimePoint last_progress{};
  };

  struct Inbound {
    frame::PayloadKind kind{frame::PayloadKind::kMedia};
    std::uint32_t total{0};
    std::uint32_t received{0};
    std::vector<std::vector<std::uint8_t>> parts;
    std::vector<bool> have;
    std::size_t bytes{0};
    TimePoint last_progress{};
  };

  void remember_completed(std::uint64_t transfer_id);

  TransferConfig config_;
  std::function<TimePoint()> now_fn_;
  std::size_t chunk_data_size_;
  std::deque<Outbound> outbound_;
  std::map<std::uint64_t, Inbound> inbound_;
  // Recently completed inbound ids, so late duplicates do not start a new transfer.
  std::deque<std::uint64_t> completed_order_;
  std::set<std::uint64_t> completed_ids_;
};

}  // namespace ghostlink::transfer
