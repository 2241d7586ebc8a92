#include "wire/codec.hpp"

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

#include "wire/crc32.hpp"

namespace res_agent::wire {
namespace {

constexpr std::size_t kFixedHeaderSize = 1 + 1 + 1 + 1 + 4 + 8 + 4;
constexpr std::size_t kChecksumSize = 4;

class ByteWriter {
 public:
  explicit ByteWriter(std::size_t reserve = 0) { bytes_.reserve(reserve); }

  void put_u8(const std::uint8_t value) { bytes_.push_back(value); }

  void put_u16(const std::uint16_t value) {
    bytes_.push_back(static_cast<std::uint8_t>(value >> 8U));
    bytes_.push_back(static_cast<std::uint8_t>(value));
  }

  void put_u32(const std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
      bytes_.push_back(static_cast<std::uint8_t>(value >> static_cast<unsigned>(shift)));
    }
  }

  void put_u64(const std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      bytes_.push_back(static_cast<std::uint8_t>(value >> static_cast<unsigned>(shift)));
    }
  }

  void put_f64(const double value) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    put_u64(bits);
  }

  void put_bytes(const std::uint8_t* data, const std::size_t size) { bytes_.insert(bytes_.end(), data, data + size); }

  void put_string(const std::string& value) {
    put_u8(static_cast<std::uint8_t>(value.size()));
    bytes_.insert(bytes_.end(), value.begin(), value.end());
  }

  std::vector<std::uint8_t>& bytes() { return bytes_; }

 private:
  std::vector<std::uint8_t> bytes_;
};

class ByteReader {
 public:
  ByteReader(const std::uint8_t* data, const std::size_t size) : data_(data), size_(size) {}

  bool get_u8(std::uint8_t& value) noexcept {
    if (remaining() < 1) {
      return false;
    }
    value = data_[offset_++];
    return true;
  }

  bool get_u16(std::uint16_t& value) noexcept {
    if (remaining() < 2) {
      return false;
    }
    value = static_cast<std::uint16_t>((data_[offset_] << 8U) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
  }

  bool get_u32(std::uint32_t& value) noexcept {
    if (remaining() < 4) {
      return false;
    }
    value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
      value = (value << 8U) | data_[offset_ + i];
    }
    offset_ += 4;
    return true;
  }

  bool get_u64(std::uint64_t& value) noexcept {
    if (remaining() < 8) {
      return false;
    }
    value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
      value = (value << 8U) | data_[offset_ + i];
    }
    offset_ += 8;
    return true;
  }

  bool get_f64(double& value) noexcept {
    std::uint64_t bits = 0;
    if (!get_u64(bits)) {
      return false;
    }
    std::memcpy(&value, &bits, sizeof(value));
    return true;
  }

  bool get_string(std::string& value) {
    std::uint8_t length = 0;
    if (!get_u8(length) || remaining() < length) {
      return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return true;
  }

  [[nodiscard]] std::size_t remaining() const noexcept { return size_ - offset_; }
  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
  void skip(const std::size_t count) noexcept { offset_ += count; }

 private:
  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t offset_{0};
};

bool known_payload_type(const std::uint8_t value) noexcept {
  return value <= static_cast<std::uint8_t>(model::PayloadType::ACK);
}

}  // namespace

const char* to_string(const DecodeStatus status) noexcept {
  switch (status) {
    case DecodeStatus::kOk:
      return "ok";
    case DecodeStatus::kTruncated:
      return "truncated";
    case DecodeStatus::kUnsupportedVersion:
      return "unsupported version";
    case DecodeStatus::kUnknownPayloadType:
      return "unknown payload type";
    case DecodeStatus::kChecksumMismatch:
      return "checksum mismatch";
    case DecodeStatus::kPayloadTooLarge:
      return "payload too large";
    case DecodeStatus::kTrailingBytes:
      return "trailing bytes";
  }
  return "unknown";
}

std::vector<std::uint8_t> encode(const model::Message& message) {
  if (message.source_id.size() > kMaxIdLength || message.destination_id.size() > kMaxIdLength) {
    throw std::length_error("node id exceeds " + std::to_string(kMaxIdLength) + " bytes");
  }
  if (message.payload.size() > kMaxPayloadSize) {
    throw std::length_error("payload of " + std::to_string(message.payload.size()) + " bytes exceeds " +
                            std::to_string(kMaxPayloadSize));
  }

  ByteWriter writer(kFixedHeaderSize + message.source_id.size() + message.destination_id.size() +
                    message.payload.size() + kChecksumSize);
  writer.put_u8(kFormatVersion);
  writer.put_u8(static_cast<std::uint8_t>(message.payload_type));
  writer.put_string(message.source_id);
  writer.put_string(message.destination_id);
  writer.put_u32(message.sequence_number);
  writer.put_u64(message.created_at_us);
  writer.put_u32(static_cast<std::uint32_t>(message.payload.size()));
  writer.put_bytes(message.payload.data(), message.payload.size());

  const std::uint32_t checksum = crc32(writer.bytes().data(), writer.bytes().size());
  writer.put_u32(checksum);
  return std::move(writer.bytes());
}

DecodeStatus decode(const std::uint8_t* data, const std::size_t size, model::Message& message) noexcept {
  if (data == nullptr || size < 1) {
    return DecodeStatus::kTruncated;
  }
  if (data[0] != kFormatVersion) {
    return DecodeStatus::kUnsupportedVersion;
  }
  if (size < kFixedHeaderSize + kChecksumSize) {
    return DecodeStatus::kTruncated;
  }

  try {
    ByteReader reader(data, size);
    std::uint8_t version = 0;
    std::uint8_t type = 0;
    model::Message decoded{};
    std::uint32_t payload_size = 0;

    if (!reader.get_u8(version) || !reader.get_u8(type) || !reader.get_string(decoded.source_id) ||
        !reader.get_string(decoded.destination_id) || !reader.get_u32(decoded.sequence_number) ||
        !reader.get_u64(decoded.created_at_us) || !reader.get_u32(payload_size)) {
      return DecodeStatus::kTruncated;
    }
    if (payload_size > kMaxPayloadSize) {
      return DecodeStatus::kPayloadTooLarge;
    }
    if (reader.remaining() < static_cast<std::size_t>(payload_size) + kChecksumSize) {
      return DecodeStatus::kTruncated;
    }

    const std::size_t payload_offset = reader.offset();
    reader.skip(payload_size);
    const std::size_t checksum_offset = reader.offset();
    std::uint32_t checksum = 0;
    if (!reader.get_u32(checksum)) {
      return DecodeStatus::kTruncated;
    }
    if (reader.remaining() != 0) {
      return DecodeStatus::kTrailingBytes;
    }
    if (crc32(data, checksum_offset) != checksum) {
      return DecodeStatus::kChecksumMismatch;
    }
    if (!known_payload_type(type)) {
      return DecodeStatus::kUnknownPayloadType;
    }

    decoded.payload_type = static_cast<model::PayloadType>(type);
    decoded.payload.assign(data + payload_offset, data + payload_offset + payload_size);
    message = std::move(decoded);
    return DecodeStatus::kOk;
  } catch (const std::bad_alloc&) {
    return DecodeStatus::kPayloadTooLarge;
  }
}

DecodeStatus decode(const std::vector<std::uint8_t>& bytes, model::Message& message) noexcept {
  return decode(bytes.data(), bytes.size(), message);
}

std::vector<std::uint8_t> encode_vector_payload(const VectorPayload& payload) {
  ByteWriter writer(8 + 8 + 2 + (payload.vectors.size() * 26));
  writer.put_u64(payload.frame_index);
  writer.put_u64(payload.timestamp_ms);
  writer.put_u16(static_cast<std::uint16_t>(payload.vectors.size()));
  for (const auto& vector : payload.vectors) {
    writer.put_u16(vector.region_id);
    writer.put_f64(vector.magnitude);
    writer.put_f64(vector.dx);
    writer.put_f64(vector.dy);
  }
  return std::move(writer.bytes());
}

bool decode_vector_payload(const std::vector<std::uint8_t>& bytes, VectorPayload& payload) {
  ByteReader reader(bytes.data(), bytes.size());
  VectorPayload decoded{};
  std::uint16_t count = 0;
  if (!reader.get_u64(decoded.frame_index) || !reader.get_u64(decoded.timestamp_ms) || !reader.get_u16(count)) {
    return false;
  }

  decoded.vectors.reserve(count);
  for (std::uint16_t i = 0; i < count; ++i) {
    model::MovementVector vector{};
    if (!reader.get_u16(vector.region_id) || !reader.get_f64(vector.magnitude) || !reader.get_f64(vector.dx) ||
        !reader.get_f64(vector.dy)) {
      return false;
    }
    vector.frame_index = decoded.frame_index;
    vector.timestamp_ms = decoded.timestamp_ms;
    decoded.vectors.push_back(vector);
  }
  if (reader.remaining() != 0) {
    return false;
  }

  payload = std::move(decoded);
  return true;
}

std::vector<std::uint8_t> encode_state_payload(const StatePayload& payload) {
  ByteWriter writer(4 + 2 + 2 + (payload.values.size() * 8));
  writer.put_u32(payload.origin_sequence);
  writer.put_u16(static_cast<std::uint16_t>(payload.target_label));
  writer.put_u16(static_cast<std::uint16_t>(payload.values.size()));
  for (const double value : payload.values) {
    writer.put_f64(value);
  }
  return std::move(writer.bytes());
}

bool decode_state_payload(const std::vector<std::uint8_t>& bytes, StatePayload& payload) {
  ByteReader reader(bytes.data(), bytes.size());
  StatePayload decoded{};
  std::uint16_t label_bits = 0;
  std::uint16_t dim = 0;
  if (!reader.get_u32(decoded.origin_sequence) || !reader.get_u16(label_bits) || !reader.get_u16(dim)) {
    return false;
  }
  decoded.target_label = static_cast<std::int16_t>(label_bits);
  if (reader.remaining() != static_cast<std::size_t>(dim) * 8U) {
    return false;
  }

  decoded.values.resize(dim);
  for (auto& value : decoded.values) {
    if (!reader.get_f64(value)) {
      return false;
    }
  }

  payload = std::move(decoded);
  return true;
}

std::vector<std::uint8_t> encode_model_payload(const model::ReadoutModel& model) {
  ByteWriter writer(4 + 8 + 2 + 2 + (model.weights.size() * 8) + (4 * 8) + 8);
  writer.put_u32(model.updates_performed);
  writer.put_u64(model.trained_at_ms);
  writer.put_u16(model.outputs);
  writer.put_u16(model.inputs);
  for (const double weight : model.weights) {
    writer.put_f64(weight);
  }
  writer.put_f64(model.metrics.accuracy);
  writer.put_f64(model.metrics.precision);
  writer.put_f64(model.metrics.recall);
  writer.put_f64(model.metrics.f1);
  writer.put_u32(model.metrics.train_size);
  writer.put_u32(model.metrics.test_size);
  return std::move(writer.bytes());
}

bool decode_model_payload(const std::vector<std::uint8_t>& bytes, model::ReadoutModel& model) {
  ByteReader reader(bytes.data(), bytes.size());
  model::ReadoutModel decoded{};
  if (!reader.get_u32(decoded.updates_performed) || !reader.get_u64(decoded.trained_at_ms) ||
      !reader.get_u16(decoded.outputs) || !reader.get_u16(decoded.inputs)) {
    return false;
  }

  const std::size_t weight_count = static_cast<std::size_t>(decoded.outputs) * decoded.inputs;
  if (reader.remaining() != (weight_count * 8U) + (4U * 8U) + 8U) {
    return false;
  }

  decoded.weights.resize(weight_count);
  for (auto& weight : decoded.weights) {
    if (!reader.get_f64(weight)) {
      return false;
    }
  }
  if (!reader.get_f64(decoded.metrics.accuracy) || !reader.get_f64(decoded.metrics.precision) ||
      !reader.get_f64(decoded.metrics.recall) || !reader.get_f64(decoded.metrics.f1) ||
      !reader.get_u32(decoded.metrics.train_size) || !reader.get_u32(decoded.metrics.test_size)) {
    return false;
  }

  model = std::move(decoded);
  return true;
}

std::vector<std::uint8_t> encode_ack_payload(const AckKind kind) {
  return {static_cast<std::uint8_t>(kind)};
}

bool decode_ack_payload(const std::vector<std::uint8_t>& bytes, AckKind& kind) noexcept {
  if (bytes.size() != 1 || bytes[0] > static_cast<std::uint8_t>(AckKind::RETRANSMIT_REQUEST)) {
    return false;
  }
  kind = static_cast<AckKind>(bytes[0]);
  return true;
}

}  // namespace res_agent::wire
