#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

#include "turbonet/vector.hpp"
#include "turbonet/websocket-constants.hpp"

namespace turbonet::websocket {

using RawBytes = vector<std::byte>;

// Stored in wire order: byte i of the key is (maskingKey >> (8 * i)) & 0xFF.
using MaskingKey = uint32_t;

inline constexpr std::size_t kNoPayloadLimit = std::numeric_limits<std::size_t>::max();

struct FrameHeader {
  uint64_t payloadLength{};
  MaskingKey maskingKey{};
  Opcode opcode{Opcode::Continuation};
  bool fin{false};
  bool masked{false};

  [[nodiscard]] std::size_t headerSize() const noexcept;
};

struct FrameParseResult {
  enum class Status : uint8_t {
    Complete,
    Incomplete,
    ProtocolError,
    // Reported as soon as the length field is decoded, before any payload byte is required.
    PayloadTooLarge,
  };

  FrameHeader header;
  // Still masked when header.masked is true.
  std::span<const std::byte> payload;
  std::size_t bytesConsumed{};
  std::string_view errorMessage;
  Status status{Status::Incomplete};
};

// Parses one frame at the start of 'data'.
// 'maxDataPayload' only applies to data frames (text, binary, continuation), control frames are bounded by
// kMaxControlFramePayload. When 'isServerSide' is true, unmasked frames are a protocol error (and masked ones
// otherwise). No extension is negotiated, so any RSV bit set is a protocol error.
[[nodiscard]] FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxDataPayload = kNoPayloadLimit,
                                          bool isServerSide = true);

// XORs 'data' in place with the rotating masking key. Applying it twice restores the input.
void ApplyMask(std::span<std::byte> data, MaskingKey maskingKey) noexcept;

// Appends a complete frame to 'output', using the minimal length encoding.
void BuildFrame(RawBytes& output, Opcode opcode, std::span<const std::byte> payload, bool fin = true,
                bool shouldMask = false, MaskingKey maskingKey = 0);

// Appends a Close frame. The reason is truncated so that the payload fits in a control frame.
void BuildCloseFrame(RawBytes& output, CloseCode code, std::string_view reason = {}, bool shouldMask = false,
                     MaskingKey maskingKey = 0);

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;
};

// Decodes an (unmasked) Close frame payload. An empty payload yields NoStatusReceived.
// Returns ProtocolError for a one byte payload or a code that may not appear on the wire.
[[nodiscard]] ClosePayload ParseClosePayload(std::span<const std::byte> payload) noexcept;

[[nodiscard]] inline std::span<const std::byte> AsBytes(std::string_view str) noexcept {
  return std::as_bytes(std::span<const char>(str.data(), str.size()));
}

[[nodiscard]] inline std::string_view AsStringView(std::span<const std::byte> bytes) noexcept {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace turbonet::websocket
