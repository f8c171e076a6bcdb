#include "transport/frame/stream_reassembler.h"

#include <algorithm>

#include "common/logging/logger.h"
#include "transport/frame/frame_codec.h"

namespace ghostlink::frame {

StreamReassembler::StreamReassembler(std::size_t max_buffer_bytes)
    : max_buffer_bytes_(max_buffer_bytes) {
  buffer_.reserve(std::min<std::size_t>(max_buffer_bytes_, kReadChunkSize * 4));
}

bool StreamReassembler::feed(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return true;
  }
  if (buffered() + bytes.size() > max_buffer_bytes_) {
    LOG_WARN("StreamReassembler: buffer limit {} exceeded (buffered={}, incoming={})",
             max_buffer_bytes_, buffered(), bytes.size());
    return false;
  }
  compact();
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  return true;
}

ReassemblyResult StreamReassembler::next() {
  ReassemblyResult result{};
  const std::span<const std::uint8_t> pending(buffer_.data() + offset_, buffered());

  // Reject a bad magic as soon as the first bytes are in, without waiting
  // for a full header.
  const auto magic_bytes = std::min(pending.size(), kMagic.size());
  if (!std::equal(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(magic_bytes),
                  kMagic.begin())) {
    result.status = ReassemblyResult::Status::kError;
    result.error = FrameError::kBadMagic;
    return result;
  }
  if (pending.size() < kHeaderSize) {
    return result;
  }

  FrameError error{};
  const auto header = FrameCodec::peek_header(pending, error);
  if (!header) {
    result.status = ReassemblyResult::Status::kError;
    result.error = error;
    return result;
  }

  const auto frame_size = FrameCodec::encoded_size(header->length);
  if (pending.size() < frame_size) {
    return result;
  }

  auto frame = FrameCodec::decode(pending.first(frame_size), error);
  if (!frame) {
    result.status = ReassemblyResult::Status::kError;
    result.error = error;
    return result;
  }

  offset_ += frame_size;
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  result.status = ReassemblyResult::Status::kFrame;
  result.frame = std::move(*frame);
  return result;
}

std::size_t StreamReassembler::resync() {
  if (buffered() == 0) {
    return 0;
  }
  const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_) + 1;
  const auto it = std::search(begin, buffer_.end(), kMagic.begin(), kMagic.end());
  std::size_t next_offset = static_cast<std::size_t>(it - buffer_.begin());
  if (it == buffer_.end() && buffer_.back() == kMagic[0] && buffer_.size() - 1 > offset_) {
    // Keep a trailing first magic byte; its partner may arrive with the next read.
    next_offset = buffer_.size() - 1;
  }
  const auto dropped = next_offset - offset_;
  offset_ = next_offset;
  compact();
  LOG_DEBUG("StreamReassembler: resync dropped {} bytes", dropped);
  return dropped;
}

void StreamReassembler::reset() {
  buffer_.clear();
  offset_ = 0;
}

void StreamReassembler::compact() {
  if (offset_ == 0) {
    return;
  }
  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
  offset_ = 0;
}

}  // namespace ghostlink::frame
