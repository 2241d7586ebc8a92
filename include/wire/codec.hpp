#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "model/message.hpp"
#include "model/movement.hpp"
#include "model/readout_model.hpp"

namespace res_agent::wire {

// Frame layout, big-endian. DO NOT reorder fields; deployed nodes decode this layout.
//   u8  version
//   u8  payload_type
//   u8  source_id length, bytes
//   u8  destination_id length, bytes
//   u32 sequence_number
//   u64 created_at_us
//   u32 payload length, bytes
//   u32 crc32 over everything above
inline constexpr std::uint8_t kFormatVersion = 1;
inline constexpr std::size_t kMaxPayloadSize = 60000;
inline constexpr std::size_t kMaxIdLength = 255;
// Largest VECTOR batch that fits in one payload.
inline constexpr std::size_t kMaxVectorsPerBatch = (kMaxPayloadSize - 18) / 26;

enum class DecodeStatus : std::uint8_t {
  kOk = 0,
  kTruncated,
  kUnsupportedVersion,
  kUnknownPayloadType,
  kChecksumMismatch,
  kPayloadTooLarge,
  kTrailingBytes,
};

const char* to_string(DecodeStatus status) noexcept;

// Throws std::length_error when an id or the payload exceeds its limit.
std::vector<std::uint8_t> encode(const model::Message& message);

DecodeStatus decode(const std::uint8_t* data, std::size_t size, model::Message& message) noexcept;
DecodeStatus decode(const std::vector<std::uint8_t>& bytes, model::Message& message) noexcept;

struct VectorPayload {
  std::uint64_t frame_index{0};
  std::uint64_t timestamp_ms{0};
  // frame_index and timestamp_ms of each entry are carried once per batch.
  std::vector<model::MovementVector> vectors;
};

struct StatePayload {
  std::uint32_t origin_sequence{0};
  std::int16_t target_label{-1};
  std::vector<double> values;
};

enum class AckKind : std::uint8_t {
  ACK = 0,
  RETRANSMIT_REQUEST = 1,
};

std::vector<std::uint8_t> encode_vector_payload(const VectorPayload& payload);
bool decode_vector_payload(const std::vector<std::uint8_t>& bytes, VectorPayload& payload);

std::vector<std::uint8_t> encode_state_payload(const StatePayload& payload);
bool decode_state_payload(const std::vector<std::uint8_t>& bytes, StatePayload& payload);

std::vector<std::uint8_t> encode_model_payload(const model::ReadoutModel& model);
bool decode_model_payload(const std::vector<std::uint8_t>& bytes, model::ReadoutModel& model);

std::vector<std::uint8_t> encode_ack_payload(AckKind kind);
bool decode_ack_payload(const std::vector<std::uint8_t>& bytes, AckKind& kind) noexcept;

}  // namespace res_agent::wire
