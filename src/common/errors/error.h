#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

namespace ghostlink {

// Byte stream failures. Every transport error ends the current connection.
enum class TransportError : int {
  kClosed = 1,
  kIoFault = 2,
  kTimeout = 3,
  kCancelled = 4,
  // A sent message was never acknowledged and the session it belonged to is gone.
  kUndelivered = 5,
};

// Malformed frames seen on the wire.
enum class FrameError : int {
  kBadDigest = 1,
  kLengthMismatch = 2,
  kUnknownType = 3,
  kOversize = 4,
  kBadMagic = 5,
  kBadVersion = 6,
  kSequenceGap = 7,
};

enum class CryptoError : int {
  kAuthFailure = 1,
  kMalformed = 2,
  kNoKey = 3,
};

enum class HandshakeError : int {
  kTimeout = 1,
  kMalformed = 2,
  kVersionMismatch = 3,
  kKeyMismatch = 4,
  kConfirmationFailed = 5,
  kUnexpectedFrame = 6,
};

enum class TransferError : int {
  kTimeout = 1,
  kMalformedChunk = 2,
  kTooLarge = 3,
  kCancelled = 4,
};

const std::error_category& transport_category() noexcept;
const std::error_category& frame_category() noexcept;
const std::error_category& crypto_category() noexcept;
const std::error_category& handshake_category() noexcept;
const std::error_category& transfer_category() noexcept;

std::error_code make_error_code(TransportError e) noexcept;
std::error_code make_error_code(FrameError e) noexcept;
std::error_code make_error_code(CryptoError e) noexcept;
std::error_code make_error_code(HandshakeError e) noexcept;
std::error_code make_error_code(TransferError e) noexcept;

// Coarse classification used by the session error policy and by Error events.
enum class ErrorKind : std::uint8_t {
  kTransport,
  kFrame,
  kCrypto,
  kHandshake,
  kTransfer,
  kFatal,
};

ErrorKind classify(const std::error_code& ec) noexcept;
const char* to_string(ErrorKind kind) noexcept;

}  // namespace ghostlink

namespace std {
template <>
struct is_error_code_enum<ghostlink::TransportError> : true_type {};
template <>
struct is_error_code_enum<ghostlink::FrameError> : true_type {};
template <>
struct is_error_code_enum<ghostlink::CryptoError> : true_type {};
template <>
struct is_error_code_enum<ghostlink::HandshakeError> : true_type {};
template <>
struct is_error_code_enum<ghostlink::TransferError> : true_type {};
}  // namespace std
