#include "transport/transfer/transfer_manager.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/crypto/crypto_envelope.h"
#include "common/crypto/random.h"
#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "transport/frame/frame_codec.h"

namespace {
constexpr std::size_t kCompletedHistory = 256;
}  // namespace

namespace ghostlink::transfer {

TransferManager::TransferManager(TransferConfig config, std::function<TimePoint()> now_fn)
    : config_(config),
      now_fn_(std::move(now_fn)),
      chunk_data_size_(crypto::CryptoEnvelope::max_plaintext(config_.max_frame_payload)) {
  if (chunk_data_size_ <= frame::kChunkBodyHeaderSize) {
    throw std::invalid_argument("max_frame_payload too small for chunking");
  }
  chunk_data_size_ -= frame::kChunkBodyHeaderSize;
  if (config_.window_chunks == 0) {
    config_.window_chunks = 1;
  }
}

std::uint32_t TransferManager::chunk_count(std::size_t payload_size, std::size_t chunk_data_size) {
  if (payload_size == 0) {
    return 1;
  }
  return static_cast<std::uint32_t>((payload_size + chunk_data_size - 1) / chunk_data_size);
}

std::optional<std::uint64_t> TransferManager::enqueue(frame::PayloadKind kind,
                                                      std::vector<std::uint8_t> payload,
                                                      std::error_code& error) {
  if (payload.size() > config_.max_transfer_bytes) {
    error = TransferError::kTooLarge;
    return std::nullopt;
  }
  const auto total = chunk_count(payload.size(), chunk_data_size_);
  if (total > kMaxChunksPerTransfer) {
    error = TransferError::kTooLarge;
    return std::nullopt;
  }

  Outbound transfer{};
  transfer.transfer_id = crypto::random_uint64();
  transfer.kind = kind;
  transfer.payload = std::move(payload);
  transfer.total = total;
  transfer.last_progress = now_fn_();
  const auto id = transfer.transfer_id;
  LOG_DEBUG("Queued transfer {}: {} bytes in {} chunks", id, transfer.payload.size(), total);
  outbound_.push_back(std::move(transfer));
  return id;
}

std::vector<frame::ChunkBody> TransferManager::poll_outbound() {
  std::vector<frame::ChunkBody> chunks;
  for (auto& transfer : outbound_) {
    while (transfer.next_index < transfer.total &&
           transfer.in_flight.size() < config_.window_chunks) {
      const std::size_t begin = static_cast<std::size_t>(transfer.next_index) * chunk_data_size_;
      const std::size_t end = std::min(begin + chunk_data_size_, transfer.payload.size());
      frame::ChunkBody body{};
      body.transfer_id = transfer.transfer_id;
      body.index = transfer.next_index;
      body.total = transfer.total;
      body.kind = transfer.kind;
      body.data.assign(transfer.payload.begin() + static_cast<std::ptrdiff_t>(begin),
                       transfer.payload.begin() + static_cast<std::ptrdiff_t>(end));
      transfer.in_flight.insert(transfer.next_index);
      ++transfer.next_index;
      chunks.push_back(std::move(body));
    }
  }
  return chunks;
}

std::optional<std::uint64_t> TransferManager::on_chunk_ack(const frame::ChunkAckBody& ack) {
  auto it = std::find_if(outbound_.begin(), outbound_.end(), [&](const Outbound& t) {
    return t.transfer_id == ack.transfer_id;
  });
  if (it == outbound_.end()) {
    LOG_TRACE("CHUNK_ACK for unknown transfer {}", ack.transfer_id);
    return std::nullopt;
  }
  if (it->in_flight.erase(ack.index) == 0) {
    return std::nullopt;
  }
  ++it->acked;
  it->last_progress = now_fn_();
  if (it->acked < it->total) {
    return std::nullopt;
  }
  const auto id = it->transfer_id;
  LOG_DEBUG("Outbound transfer {} fully acknowledged", id);
  outbound_.erase(it);
  return id;
}

InboundResult TransferManager::on_chunk(const frame::ChunkBody& chunk) {
  InboundResult result{};
  const auto id = chunk.transfer_id;

  if (completed_ids_.contains(id)) {
    result.duplicate = true;
    return result;
  }

  if (chunk.total == 0 || chunk.total > kMaxChunksPerTransfer || chunk.index >= chunk.total) {
    LOG_WARN("Malformed chunk for transfer {}: index={}, total={}", id, chunk.index, chunk.total);
    inbound_.erase(id);
    result.error = TransferError::kMalformedChunk;
    return result;
  }

  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    if (inbound_.size() >= config_.max_inbound_transfers) {
      LOG_WARN("Too many concurrent inbound transfers; rejecting {}", id);
      result.error = TransferError::kTooLarge;
      return result;
    }
    Inbound state{};
    state.kind = chunk.kind;
    state.total = chunk.total;
    state.parts.resize(chunk.total);
    state.have.assign(chunk.total, false);
    it = inbound_.emplace(id, std::move(state)).first;
  }

  auto& state = it->second;
  if (state.total != chunk.total || state.kind != chunk.kind) {
    LOG_WARN("Chunk metadata for transfer {} disagrees with earlier chunks", id);
    inbound_.erase(it);
    result.error = TransferError::kMalformedChunk;
    return result;
  }
  if (state.have[chunk.index]) {
    result.duplicate = true;
    return result;
  }
  if (state.bytes + chunk.data.size() > config_.max_transfer_bytes) {
    LOG_WARN("Inbound transfer {} exceeds {} bytes", id, config_.max_transfer_bytes);
    inbound_.erase(it);
    result.error = TransferError::kTooLarge;
    return result;
  }

  state.parts[chunk.index] = chunk.data;
  state.have[chunk.index] = true;
  state.bytes += chunk.data.size();
  ++state.received;
  state.last_progress = now_fn_();

  if (state.received < state.total) {
    return result;
  }

  CompletedTransfer done{};
  done.transfer_id = id;
  done.kind = state.kind;
  done.data.reserve(state.bytes);
  for (auto& part : state.parts) {
    done.data.insert(done.data.end(), part.begin(), part.end());
  }
  inbound_.erase(it);
  remember_completed(id);
  LOG_DEBUG("Inbound transfer {} complete: {} bytes", id, done.data.size());
  result.completed = std::move(done);
  return result;
}

std::vector<DroppedTransfer> TransferManager::expire() {
  std::vector<DroppedTransfer> dropped;
  const auto now = now_fn_();
  for (auto it = inbound_.begin(); it != inbound_.end();) {
    if (now - it->second.last_progress >= config_.transfer_timeout) {
      LOG_WARN("Inbound transfer {} timed out ({}/{} chunks)", it->first, it->second.received,
               it->second.total);
      dropped.push_back({it->first, TransferDirection::kInbound,
                         make_error_code(TransferError::kTimeout)});
      it = inbound_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = outbound_.begin(); it != outbound_.end();) {
    if (now - it->last_progress >= config_.transfer_timeout) {
      LOG_WARN("Outbound transfer {} timed out ({}/{} chunks acknowledged)", it->transfer_id,
               it->acked, it->total);
      dropped.push_back({it->transfer_id, TransferDirection::kOutbound,
                         make_error_code(TransferError::kTimeout)});
      it = outbound_.erase(it);
    } else {
      ++it;
    }
  }
  return dropped;
}

std::vector<DroppedTransfer> TransferManager::cancel_all() {
  std::vector<DroppedTransfer> dropped;
  for (const auto& [id, state] : inbound_) {
    dropped.push_back({id, TransferDirection::kInbound, make_error_code(TransferError::kCancelled)});
  }
  for (const auto& transfer : outbound_) {
    dropped.push_back({transfer.transfer_id, TransferDirection::kOutbound,
                       make_error_code(TransferError::kCancelled)});
  }
  inbound_.clear();
  outbound_.clear();
  return dropped;
}

void TransferManager::touch_all() {
  const auto now = now_fn_();
  for (auto& [id, state] : inbound_) {
    state.last_progress = now;
  }
  for (auto& transfer : outbound_) {
    transfer.last_progress = now;
  }
}

std::optional<TransferManager::TimePoint> TransferManager::next_expiry() const {
  std::optional<TimePoint> earliest;
  auto consider = [&](TimePoint last_progress) {
    const auto deadline = last_progress + config_.transfer_timeout;
    if (!earliest || deadline < *earliest) {
      earliest = deadline;
    }
  };
  for (const auto& [id, state] : inbound_) {
    consider(state.last_progress);
  }
  for (const auto& transfer : outbound_) {
    consider(transfer.last_progress);
  }
  return earliest;
}

void TransferManager::remember_completed(std::uint64_t transfer_id) {
  completed_ids_.insert(transfer_id);
  completed_order_.push_back(transfer_id);
  if (completed_order_.size() > kCompletedHistory) {
    completed_ids_.erase(completed_order_.front());
    completed_order_.pop_front();
  }
}

}  // namespace ghostlink::transfer
