#include "turbonet/websocket-frame.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include "turbonet/websocket-constants.hpp"

namespace turbonet::websocket {

namespace {

FrameParseResult Error(FrameParseResult::Status status, std::string_view message) {
  FrameParseResult result;
  result.status = status;
  result.errorMessage = message;
  return result;
}

void AppendBytes(RawBytes& output, std::span<const std::byte> bytes) {
  output.insert(output.end(), bytes.begin(), bytes.end());
}

}  // namespace

std::size_t FrameHeader::headerSize() const noexcept {
  std::size_t sz = kMinFrameHeaderSize;
  if (payloadLength > 0xFFFF) {
    sz += 8;
  } else if (payloadLength >= static_cast<uint64_t>(kPayloadLen16)) {
    sz += 2;
  }
  if (masked) {
    sz += kMaskingKeySize;
  }
  return sz;
}

FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxDataPayload, bool isServerSide) {
  using Status = FrameParseResult::Status;

  if (data.size() < kMinFrameHeaderSize) {
    return {};
  }

  FrameParseResult result;
  const std::byte byte0 = data[0];
  const std::byte byte1 = data[1];

  if ((byte0 & kRsvBits) != std::byte{0}) {
    return Error(Status::ProtocolError, "Reserved bits must be 0");
  }
  const std::byte rawOpcode = byte0 & kOpcodeMask;
  if (IsReservedOpcode(rawOpcode)) {
    return Error(Status::ProtocolError, "Reserved opcode");
  }
  result.header.opcode = static_cast<Opcode>(rawOpcode);
  result.header.fin = (byte0 & kFinBit) != std::byte{0};
  if (IsControlFrame(result.header.opcode) && !result.header.fin) {
    return Error(Status::ProtocolError, "Control frames must not be fragmented");
  }

  result.header.masked = (byte1 & kMaskBit) != std::byte{0};
  if (result.header.masked != isServerSide) {
    return Error(Status::ProtocolError, isServerSide ? "Client frames must be masked" : "Server frames must not be masked");
  }

  std::size_t offset = kMinFrameHeaderSize;
  const std::byte payloadLen7 = byte1 & kPayloadLenMask;
  if (payloadLen7 == kPayloadLen16) {
    if (data.size() < offset + 2) {
      return {};
    }
    result.header.payloadLength = (static_cast<uint64_t>(data[offset]) << 8) | static_cast<uint64_t>(data[offset + 1]);
    offset += 2;
    if (result.header.payloadLength < static_cast<uint64_t>(kPayloadLen16)) {
      return Error(Status::ProtocolError, "Non-minimal extended length encoding");
    }
  } else if (payloadLen7 == kPayloadLen64) {
    if (data.size() < offset + 8) {
      return {};
    }
    for (std::size_t idx = 0; idx < 8; ++idx) {
      result.header.payloadLength = (result.header.payloadLength << 8) | static_cast<uint64_t>(data[offset + idx]);
    }
    offset += 8;
    if ((result.header.payloadLength >> 63) != 0) {
      return Error(Status::ProtocolError, "Invalid payload length (MSB set)");
    }
    if (result.header.payloadLength <= 0xFFFF) {
      return Error(Status::ProtocolError, "Non-minimal extended length encoding");
    }
  } else {
    result.header.payloadLength = static_cast<uint64_t>(payloadLen7);
  }

  if (IsControlFrame(result.header.opcode)) {
    if (result.header.payloadLength > kMaxControlFramePayload) {
      return Error(Status::ProtocolError, "Control frame payload too large");
    }
  } else if (result.header.payloadLength > static_cast<uint64_t>(maxDataPayload)) {
    FrameParseResult tooLarge = Error(Status::PayloadTooLarge, "Message too big");
    tooLarge.header = result.header;
    return tooLarge;
  }

  if (result.header.masked) {
    if (data.size() < offset + kMaskingKeySize) {
      return {};
    }
    std::memcpy(&result.header.maskingKey, data.data() + offset, kMaskingKeySize);
    offset += kMaskingKeySize;
  }

  if (data.size() - offset < result.header.payloadLength) {
    return {};
  }

  const auto payloadLength = static_cast<std::size_t>(result.header.payloadLength);
  result.status = Status::Complete;
  result.payload = data.subspan(offset, payloadLength);
  result.bytesConsumed = offset + payloadLength;
  return result;
}

void ApplyMask(std::span<std::byte> data, MaskingKey maskingKey) noexcept {
  const std::size_t sz = data.size();
  std::byte* bytes = data.data();
  std::size_t idx = 0;
  if (sz >= 8) {
    // memcpy keeps the in-memory byte order, so the doubled key lines up with the payload bytes
    const uint64_t mask64 = static_cast<uint64_t>(maskingKey) | (static_cast<uint64_t>(maskingKey) << 32);
    for (; idx + 8 <= sz; idx += 8) {
      uint64_t chunk;
      std::memcpy(&chunk, bytes + idx, sizeof(chunk));
      chunk ^= mask64;
      std::memcpy(bytes + idx, &chunk, sizeof(chunk));
    }
  }
  std::byte keyBytes[kMaskingKeySize];
  std::memcpy(keyBytes, &maskingKey, kMaskingKeySize);
  for (; idx < sz; ++idx) {
    bytes[idx] ^= keyBytes[idx & 3U];
  }
}

void BuildFrame(RawBytes& output, Opcode opcode, std::span<const std::byte> payload, bool fin, bool shouldMask,
                MaskingKey maskingKey) {
  const std::size_t payloadSize = payload.size();

  std::byte byte0 = static_cast<std::byte>(opcode);
  if (fin) {
    byte0 |= kFinBit;
  }
  output.push_back(byte0);

  const std::byte maskFlag = shouldMask ? kMaskBit : std::byte{0};
  if (payloadSize < static_cast<std::size_t>(kPayloadLen16)) {
    output.push_back(maskFlag | static_cast<std::byte>(payloadSize));
  } else if (payloadSize <= 0xFFFF) {
    output.push_back(maskFlag | kPayloadLen16);
    output.push_back(static_cast<std::byte>((payloadSize >> 8) & 0xFF));
    output.push_back(static_cast<std::byte>(payloadSize & 0xFF));
  } else {
    output.push_back(maskFlag | kPayloadLen64);
    for (int shift = 56; shift >= 0; shift -= 8) {
      output.push_back(static_cast<std::byte>((static_cast<uint64_t>(payloadSize) >> shift) & 0xFF));
    }
  }

  if (shouldMask) {
    std::byte keyBytes[kMaskingKeySize];
    std::memcpy(keyBytes, &maskingKey, kMaskingKeySize);
    AppendBytes(output, keyBytes);
  }

  const std::size_t payloadStart = output.size();
  AppendBytes(output, payload);
  if (shouldMask) {
    ApplyMask(std::span<std::byte>(output.data() + payloadStart, payloadSize), maskingKey);
  }
}

void BuildCloseFrame(RawBytes& output, CloseCode code, std::string_view reason, bool shouldMask,
                     MaskingKey maskingKey) {
  FixedCapacityVector<std::byte, kMaxControlFramePayload> payload;
  if (code != CloseCode::NoStatusReceived && code != CloseCode::AbnormalClosure) {
    const auto codeVal = static_cast<uint16_t>(code);
    payload.push_back(static_cast<std::byte>((codeVal >> 8) & 0xFF));
    payload.push_back(static_cast<std::byte>(codeVal & 0xFF));
    reason = reason.substr(0, kMaxControlFramePayload - 2);
    for (char ch : reason) {
      payload.push_back(static_cast<std::byte>(ch));
    }
  }
  BuildFrame(output, Opcode::Close, std::span<const std::byte>(payload.data(), payload.size()), true, shouldMask,
             maskingKey);
}

ClosePayload ParseClosePayload(std::span<const std::byte> payload) noexcept {
  ClosePayload result;
  if (payload.empty()) {
    return result;
  }
  if (payload.size() == 1) {
    result.code = CloseCode::ProtocolError;
    return result;
  }
  const auto codeVal =
      static_cast<uint16_t>((static_cast<uint16_t>(payload[0]) << 8) | static_cast<uint16_t>(payload[1]));
  if (!IsValidWireCloseCode(codeVal)) {
    result.code = CloseCode::ProtocolError;
    return result;
  }
  result.code = static_cast<CloseCode>(codeVal);
  result.reason = AsStringView(payload.subspan(2));
  return result;
}

}  // namespace turbonet::websocket
