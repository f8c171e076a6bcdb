#include "transport/session/retransmit_buffer.h"

#include <algorithm>
#include <utility>

#include "common/logging/logger.h"

namespace {

bool is_data(ghostlink::frame::FrameType type) {
  return type == ghostlink::frame::FrameType::kDataText ||
         type == ghostlink::frame::FrameType::kDataChunk;
}

}  // namespace

namespace ghostlink::transport {

RetransmitBuffer::RetransmitBuffer(RetransmitConfig config) : config_(config) {}

void RetransmitBuffer::insert(std::uint64_t sequence, frame::FrameType type,
                              std::vector<std::uint8_t> wire) {
  if (pending_.empty() && next_sequence_ == 0 && floor_ == 0) {
    floor_ = sequence;
  }
  while (!pending_.empty() &&
         (buffered_bytes_ + wire.size() > config_.max_buffer_bytes ||
          (config_.max_pending_count > 0 && pending_.size() >= config_.max_pending_count))) {
    evict_oldest();
  }

  buffered_bytes_ += wire.size();
  next_sequence_ = std::max(next_sequence_, sequence + 1);
  pending_.insert_or_assign(sequence, PendingFrame{
                                          .sequence = sequence,
                                          .type = type,
                                          .wire = std::move(wire),
                                      });
}

void RetransmitBuffer::acknowledge_cumulative(std::uint64_t next_expected) {
  std::size_t acked = 0;
  auto it = pending_.begin();
  while (it != pending_.end() && it->first < next_expected) {
    buffered_bytes_ -= it->second.wire.size();
    it = pending_.erase(it);
    ++acked;
  }
  evicted_data_.erase(evicted_data_.begin(), evicted_data_.lower_bound(next_expected));
  floor_ = std::max(floor_, next_expected);
  LOG_TRACE("RetransmitBuffer: ack next_expected={}, released={}, pending={}", next_expected,
            acked, pending_.size());
}

bool RetransmitBuffer::covers(std::uint64_t next_expected) const {
  if (next_expected > next_sequence_) {
    // The peer claims frames we never sent.
    return false;
  }
  return next_expected >= floor_;
}

std::vector<const PendingFrame*> RetransmitBuffer::frames_from(std::uint64_t next_expected) const {
  std::vector<const PendingFrame*> result;
  for (auto it = pending_.lower_bound(next_expected); it != pending_.end(); ++it) {
    result.push_back(&it->second);
  }
  return result;
}

std::vector<std::uint64_t> RetransmitBuffer::unacknowledged(frame::FrameType type) const {
  std::vector<std::uint64_t> sequences;
  for (const auto& [sequence, evicted_type] : evicted_data_) {
    if (evicted_type == type) {
      sequences.push_back(sequence);
    }
  }
  for (const auto& [sequence, pending] : pending_) {
    if (pending.type == type) {
      sequences.push_back(sequence);
    }
  }
  return sequences;
}

bool RetransmitBuffer::has_unacknowledged_data() const {
  return !evicted_data_.empty() ||
         std::any_of(pending_.begin(), pending_.end(),
                     [](const auto& entry) { return is_data(entry.second.type); });
}

void RetransmitBuffer::clear() {
  pending_.clear();
  evicted_data_.clear();
  buffered_bytes_ = 0;
  next_sequence_ = 0;
  floor_ = 0;
}

void RetransmitBuffer::evict_oldest() {
  auto it = pending_.begin();
  LOG_WARN("RetransmitBuffer: evicting unacknowledged frame seq={} ({} bytes buffered)", it->first,
           buffered_bytes_);
  buffered_bytes_ -= it->second.wire.size();
  floor_ = std::max(floor_, it->first + 1);
  if (is_data(it->second.type)) {
    evicted_data_.emplace(it->first, it->second.type);
  }
  pending_.erase(it);
}

}  // namespace ghostlink::transport
