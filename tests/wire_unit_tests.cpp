#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/message.hpp"
#include "model/readout_model.hpp"
#include "wire/codec.hpp"
#include "wire/crc32.hpp"

using res_agent::model::Message;
using res_agent::model::MovementVector;
using res_agent::model::PayloadType;
using res_agent::model::ReadoutModel;
using res_agent::wire::AckKind;
using res_agent::wire::DecodeStatus;
using res_agent::wire::StatePayload;
using res_agent::wire::VectorPayload;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

Message sample_message() {
  Message message{};
  message.source_id = "res00";
  message.destination_id = "res01";
  message.sequence_number = 0xDEADBEEFU;
  message.payload_type = PayloadType::STATE;
  message.payload = {0x00, 0x01, 0x7F, 0x80, 0xFF};
  message.created_at_us = 1'700'000'000'123'456ULL;
  return message;
}

void put_u32_be(std::vector<std::uint8_t>& bytes, const std::size_t offset, const std::uint32_t value) {
  bytes[offset] = static_cast<std::uint8_t>(value >> 24U);
  bytes[offset + 1] = static_cast<std::uint8_t>(value >> 16U);
  bytes[offset + 2] = static_cast<std::uint8_t>(value >> 8U);
  bytes[offset + 3] = static_cast<std::uint8_t>(value);
}

void reseal(std::vector<std::uint8_t>& bytes) {
  const auto body = bytes.size() - 4;
  put_u32_be(bytes, body, res_agent::wire::crc32(bytes.data(), body));
}

int test_crc32_check_value() {
  const std::string check = "123456789";
  const auto value = res_agent::wire::crc32(reinterpret_cast<const std::uint8_t*>(check.data()), check.size());
  if (value != 0xCBF43926U) {
    return fail("test_crc32_check_value", "CRC-32 of 123456789 must be 0xCBF43926");
  }
  if (res_agent::wire::crc32(nullptr, 0) != 0U) {
    return fail("test_crc32_check_value", "CRC-32 of empty input must be 0");
  }
  return 0;
}

int test_message_decodes_to_equal_value() {
  const auto message = sample_message();
  const auto bytes = res_agent::wire::encode(message);

  Message decoded{};
  if (res_agent::wire::decode(bytes, decoded) != DecodeStatus::kOk) {
    return fail("test_message_decodes_to_equal_value", "valid frame should decode");
  }
  if (!(decoded == message)) {
    return fail("test_message_decodes_to_equal_value", "decoded message differs from the original");
  }

  Message empty{};
  empty.payload_type = PayloadType::ACK;
  Message empty_decoded{};
  if (res_agent::wire::decode(res_agent::wire::encode(empty), empty_decoded) != DecodeStatus::kOk ||
      !(empty_decoded == empty)) {
    return fail("test_message_decodes_to_equal_value", "empty ids and payload should survive");
  }
  return 0;
}

int test_every_prefix_is_truncated() {
  const auto bytes = res_agent::wire::encode(sample_message());
  for (std::size_t size = 0; size < bytes.size(); ++size) {
    Message decoded{};
    if (res_agent::wire::decode(bytes.data(), size, decoded) != DecodeStatus::kTruncated) {
      return fail("test_every_prefix_is_truncated", "strict prefix must report truncation");
    }
  }
  return 0;
}

int test_corruption_is_detected() {
  const auto bytes = res_agent::wire::encode(sample_message());

  // Flip one bit in every byte after the version; each must be caught.
  for (std::size_t i = 1; i < bytes.size(); ++i) {
    auto corrupted = bytes;
    corrupted[i] ^= 0x10U;
    Message decoded{};
    if (res_agent::wire::decode(corrupted, decoded) == DecodeStatus::kOk) {
      return fail("test_corruption_is_detected", "single bit flip decoded as ok");
    }
  }

  auto trailing = bytes;
  trailing.push_back(0x00);
  Message decoded{};
  if (res_agent::wire::decode(trailing, decoded) != DecodeStatus::kTrailingBytes) {
    return fail("test_corruption_is_detected", "extra byte should be reported as trailing");
  }
  return 0;
}

int test_version_and_type_are_checked() {
  auto bytes = res_agent::wire::encode(sample_message());

  auto future = bytes;
  future[0] = 2;
  reseal(future);
  Message decoded{};
  if (res_agent::wire::decode(future, decoded) != DecodeStatus::kUnsupportedVersion) {
    return fail("test_version_and_type_are_checked", "version 2 must be rejected");
  }

  auto unknown = bytes;
  unknown[1] = 9;
  reseal(unknown);
  if (res_agent::wire::decode(unknown, decoded) != DecodeStatus::kUnknownPayloadType) {
    return fail("test_version_and_type_are_checked", "payload type 9 must be rejected");
  }
  return 0;
}

int test_size_limits() {
  auto message = sample_message();
  message.payload.assign(res_agent::wire::kMaxPayloadSize + 1, 0xAB);
  bool threw = false;
  try {
    (void)res_agent::wire::encode(message);
  } catch (const std::length_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_size_limits", "oversized payload should throw length_error");
  }

  message = sample_message();
  message.source_id.assign(256, 'n');
  threw = false;
  try {
    (void)res_agent::wire::encode(message);
  } catch (const std::length_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_size_limits", "256-byte node id should throw length_error");
  }

  message = sample_message();
  message.payload.assign(res_agent::wire::kMaxPayloadSize, 0xAB);
  message.payload.back() = 0x5C;
  Message decoded{};
  if (res_agent::wire::decode(res_agent::wire::encode(message), decoded) != DecodeStatus::kOk) {
    return fail("test_size_limits", "payload at the limit should decode");
  }
  if (!(decoded == message)) {
    return fail("test_size_limits", "payload at the limit should decode to an equal message");
  }

  message = sample_message();
  message.payload.clear();
  Message empty_decoded{};
  if (res_agent::wire::decode(res_agent::wire::encode(message), empty_decoded) != DecodeStatus::kOk ||
      !(empty_decoded == message) || !empty_decoded.payload.empty()) {
    return fail("test_size_limits", "empty payload should decode to an equal message");
  }

  // Claimed length beyond the limit, checked before any allocation.
  auto bytes = res_agent::wire::encode(sample_message());
  const std::size_t length_offset = 1 + 1 + 1 + 5 + 1 + 5 + 4 + 8;
  put_u32_be(bytes, length_offset, static_cast<std::uint32_t>(res_agent::wire::kMaxPayloadSize + 1));
  if (res_agent::wire::decode(bytes, decoded) != DecodeStatus::kPayloadTooLarge) {
    return fail("test_size_limits", "claimed length over the limit must be rejected");
  }
  return 0;
}

int test_vector_payload() {
  VectorPayload payload{};
  payload.frame_index = 42;
  payload.timestamp_ms = 1'700'000'000'000ULL;
  payload.vectors.push_back(MovementVector{3, 12.5, -1.0, 2.0, 0, 0});
  payload.vectors.push_back(MovementVector{7, 0.0, 0.0, 0.0, 0, 0});

  VectorPayload decoded{};
  if (!res_agent::wire::decode_vector_payload(res_agent::wire::encode_vector_payload(payload), decoded)) {
    return fail("test_vector_payload", "vector payload should decode");
  }
  if (decoded.vectors.size() != 2 || decoded.vectors[0].region_id != 3 || decoded.vectors[0].magnitude != 12.5 ||
      decoded.vectors[1].frame_index != 42 || decoded.vectors[1].timestamp_ms != payload.timestamp_ms) {
    return fail("test_vector_payload", "batch fields should be carried into every vector");
  }

  auto short_bytes = res_agent::wire::encode_vector_payload(payload);
  short_bytes.pop_back();
  if (res_agent::wire::decode_vector_payload(short_bytes, decoded)) {
    return fail("test_vector_payload", "short vector payload must be rejected");
  }

  VectorPayload full{};
  full.vectors.resize(res_agent::wire::kMaxVectorsPerBatch);
  if (res_agent::wire::encode_vector_payload(full).size() > res_agent::wire::kMaxPayloadSize) {
    return fail("test_vector_payload", "largest batch must fit one payload");
  }
  full.vectors.emplace_back();
  if (res_agent::wire::encode_vector_payload(full).size() <= res_agent::wire::kMaxPayloadSize) {
    return fail("test_vector_payload", "kMaxVectorsPerBatch should be the largest batch that fits");
  }
  return 0;
}

int test_state_payload_keeps_sign_and_label() {
  StatePayload payload{};
  payload.origin_sequence = 17;
  payload.target_label = -1;
  payload.values = {-1.0, -0.0, 0.25, 1.0};

  StatePayload decoded{};
  if (!res_agent::wire::decode_state_payload(res_agent::wire::encode_state_payload(payload), decoded)) {
    return fail("test_state_payload_keeps_sign_and_label", "state payload should decode");
  }
  if (decoded.target_label != -1 || decoded.origin_sequence != 17 || decoded.values != payload.values ||
      !std::signbit(decoded.values[1])) {
    return fail("test_state_payload_keeps_sign_and_label", "label or values changed");
  }

  auto bytes = res_agent::wire::encode_state_payload(payload);
  bytes.push_back(0);
  if (res_agent::wire::decode_state_payload(bytes, decoded)) {
    return fail("test_state_payload_keeps_sign_and_label", "dimension mismatch must be rejected");
  }
  return 0;
}

int test_model_payload() {
  auto readout = ReadoutModel::passthrough(5, 50);
  readout.updates_performed = 9;
  readout.trained_at_ms = 1'700'000'000'000ULL;
  readout.metrics.accuracy = 0.8;
  readout.metrics.f1 = 0.75;
  readout.metrics.train_size = 140;
  readout.metrics.test_size = 60;

  ReadoutModel decoded{};
  if (!res_agent::wire::decode_model_payload(res_agent::wire::encode_model_payload(readout), decoded)) {
    return fail("test_model_payload", "model payload should decode");
  }
  if (!(decoded == readout)) {
    return fail("test_model_payload", "decoded readout differs");
  }

  auto bytes = res_agent::wire::encode_model_payload(readout);
  bytes.resize(bytes.size() - 8);
  if (res_agent::wire::decode_model_payload(bytes, decoded)) {
    return fail("test_model_payload", "truncated weights must be rejected");
  }
  return 0;
}

int test_ack_payload() {
  AckKind kind = AckKind::ACK;
  if (!res_agent::wire::decode_ack_payload(res_agent::wire::encode_ack_payload(AckKind::RETRANSMIT_REQUEST), kind) ||
      kind != AckKind::RETRANSMIT_REQUEST) {
    return fail("test_ack_payload", "retransmit request should decode");
  }
  if (res_agent::wire::decode_ack_payload({}, kind) || res_agent::wire::decode_ack_payload({2}, kind) ||
      res_agent::wire::decode_ack_payload({0, 0}, kind)) {
    return fail("test_ack_payload", "malformed ack payloads must be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_crc32_check_value(); rc != 0) return rc;
  if (int rc = test_message_decodes_to_equal_value(); rc != 0) return rc;
  if (int rc = test_every_prefix_is_truncated(); rc != 0) return rc;
  if (int rc = test_corruption_is_detected(); rc != 0) return rc;
  if (int rc = test_version_and_type_are_checked(); rc != 0) return rc;
  if (int rc = test_size_limits(); rc != 0) return rc;
  if (int rc = test_vector_payload(); rc != 0) return rc;
  if (int rc = test_state_payload_keeps_sign_and_label(); rc != 0) return rc;
  if (int rc = test_model_payload(); rc != 0) return rc;
  if (int rc = test_ack_payload(); rc != 0) return rc;

  std::cout << "[PASS] wire unit tests\n";
  return 0;
}
