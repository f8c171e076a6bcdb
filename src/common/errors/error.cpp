#include "common/errors/error.h"

namespace ghostlink {

namespace {

class TransportCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ghostlink.transport"; }
  std::string message(int value) const override {
    switch (static_cast<TransportError>(value)) {
      case TransportError::kClosed:
        return "stream closed by peer";
      case TransportError::kIoFault:
        return "stream I/O fault";
      case TransportError::kTimeout:
        return "stream operation timed out";
      case TransportError::kCancelled:
        return "stream operation cancelled";
      case TransportError::kUndelivered:
        return "message not acknowledged before the session was reset";
    }
    return "unknown transport error";
  }
};

class FrameCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ghostlink.frame"; }
  std::string message(int value) const override {
    switch (static_cast<FrameError>(value)) {
      case FrameError::kBadDigest:
        return "frame digest mismatch";
      case FrameError::kLengthMismatch:
        return "frame length does not match payload";
      case FrameError::kUnknownType:
        return "unknown frame type";
      case FrameError::kOversize:
        return "frame payload exceeds maximum size";
      case FrameError::kBadMagic:
        return "bad frame magic";
      case FrameError::kBadVersion:
        return "unsupported frame version";
      case FrameError::kSequenceGap:
        return "unexpected frame sequence";
    }
    return "unknown frame error";
  }
};

class CryptoCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ghostlink.crypto"; }
  std::string message(int value) const override {
    switch (static_cast<CryptoError>(value)) {
      case CryptoError::kAuthFailure:
        return "payload authentication failed";
      case CryptoError::kMalformed:
        return "sealed payload is malformed";
      case CryptoError::kNoKey:
        return "no session key established";
    }
    return "unknown crypto error";
  }
};

class HandshakeCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ghostlink.handshake"; }
  std::string message(int value) const override {
    switch (static_cast<HandshakeError>(value)) {
      case HandshakeError::kTimeout:
        return "handshake timed out";
      case HandshakeError::kMalformed:
        return "malformed handshake message";
      case HandshakeError::kVersionMismatch:
        return "protocol version mismatch";
      case HandshakeError::kKeyMismatch:
        return "peer holds a different session key";
      case HandshakeError::kConfirmationFailed:
        return "key confirmation failed";
      case HandshakeError::kUnexpectedFrame:
        return "unexpected frame during handshake";
    }
    return "unknown handshake error";
  }
};

class TransferCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ghostlink.transfer"; }
  std::string message(int value) const override {
    switch (static_cast<TransferError>(value)) {
      case TransferError::kTimeout:
        return "transfer timed out";
      case TransferError::kMalformedChunk:
        return "malformed chunk metadata";
      case TransferError::kTooLarge:
        return "transfer exceeds maximum size";
      case TransferError::kCancelled:
        return "transfer cancelled";
    }
    return "unknown transfer error";
  }
};

}  // namespace

const std::error_category& transport_category() noexcept {
  static const TransportCategory category;
  return category;
}

const std::error_category& frame_category() noexcept {
  static const FrameCategory category;
  return category;
}

const std::error_category& crypto_category() noexcept {
  static const CryptoCategory category;
  return category;
}

const std::error_category& handshake_category() noexcept {
  static const HandshakeCategory category;
  return category;
}

const std::error_category& transfer_category() noexcept {
  static const TransferCategory category;
  return category;
}

std::error_code make_error_code(TransportError e) noexcept {
  return {static_cast<int>(e), transport_category()};
}

std::error_code make_error_code(FrameError e) noexcept {
  return {static_cast<int>(e), frame_category()};
}

std::error_code make_error_code(CryptoError e) noexcept {
  return {static_cast<int>(e), crypto_category()};
}

std::error_code make_error_code(HandshakeError e) noexcept {
  return {static_cast<int>(e), handshake_category()};
}

std::error_code make_error_code(TransferError e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}

ErrorKind classify(const std::error_code& ec) noexcept {
  const auto& category = ec.category();
  if (category == frame_category()) return ErrorKind::kFrame;
  if (category == crypto_category()) return ErrorKind::kCrypto;
  if (category == handshake_category()) return ErrorKind::kHandshake;
  if (category == transfer_category()) return ErrorKind::kTransfer;
  // OS-level errors from the stream adapter count as transport failures.
  return ErrorKind::kTransport;
}

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kTransport:
      return "transport";
    case ErrorKind::kFrame:
      return "frame";
    case ErrorKind::kCrypto:
      return "crypto";
    case ErrorKind::kHandshake:
      return "handshake";
    case ErrorKind::kTransfer:
      return "transfer";
    case ErrorKind::kFatal:
      return "fatal";
  }
  return "unknown";
}

}  // namespace ghostlink
