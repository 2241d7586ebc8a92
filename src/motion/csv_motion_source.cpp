#include "motion/motion_source.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"

namespace res_agent::motion {
namespace {

constexpr double kSecondsThreshold = 1.0e11;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_number(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    value = std::stod(text, &consumed);
    return consumed == text.size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::uint64_t now_ms() { return core::unix_timestamp_now_ns() / 1'000'000ULL; }

}  // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(trim(field));
      field.clear();
    } else if (c != '\r') {
      field.push_back(c);
    }
  }
  fields.push_back(trim(field));
  return fields;
}

CsvMotionSource::CsvMotionSource(CsvMotionOptions options) : options_(std::move(options)) {
  input_.open(options_.path);
  if (!input_.is_open()) {
    throw std::runtime_error("unable to open motion file: " + options_.path);
  }
  read_header();
}

void CsvMotionSource::read_header() {
  std::string line;
  if (!std::getline(input_, line)) {
    throw std::runtime_error("motion file " + options_.path + " is empty");
  }

  region_columns_.clear();
  region_names_.clear();
  timestamp_column_.reset();

  const auto columns = split_csv_line(line);
  for (std::size_t i = 0; i < columns.size(); ++i) {
    const auto& name = columns[i];
    if (name == "timestamp") {
      timestamp_column_ = i;
      continue;
    }
    if (name == "t_sin" || name == "t_cos" || name.empty()) {
      continue;
    }
    region_columns_.push_back(i);
    region_names_.push_back(name);
  }

  if (region_columns_.empty()) {
    throw std::runtime_error("motion file " + options_.path + " has no region columns");
  }
}

std::optional<std::vector<model::MovementVector>> CsvMotionSource::next_batch() {
  if (exhausted_) {
    return std::nullopt;
  }

  std::string line;
  while (true) {
    if (std::getline(input_, line)) {
      if (!trim(line).empty()) {
        break;
      }
      continue;
    }
    if (!options_.loop) {
      std::cerr << "[motion] " << options_.path << " exhausted after " << frame_index_ << " frames\n";
      exhausted_ = true;
      return std::nullopt;
    }
    rewind();
    if (!std::getline(input_, line)) {
      exhausted_ = true;
      return std::nullopt;
    }
    if (!trim(line).empty()) {
      break;
    }
  }

  const auto fields = split_csv_line(line);

  std::uint64_t timestamp_ms = now_ms();
  double stamp = 0.0;
  if (timestamp_column_.has_value() && *timestamp_column_ < fields.size() &&
      parse_number(fields[*timestamp_column_], stamp) && stamp > 0.0) {
    timestamp_ms = stamp < kSecondsThreshold ? static_cast<std::uint64_t>(stamp * 1000.0)
                                             : static_cast<std::uint64_t>(stamp);
  }

  std::vector<model::MovementVector> batch;
  batch.reserve(region_columns_.size());
  for (std::size_t r = 0; r < region_columns_.size(); ++r) {
    const std::size_t column = region_columns_[r];
    double magnitude = 0.0;
    if (column >= fields.size() || !parse_number(fields[column], magnitude)) {
      std::cerr << "[motion] skipping malformed row " << frame_index_ << " (column " << region_names_[r] << ")\n";
      ++frame_index_;
      return std::nullopt;
    }

    model::MovementVector vector{};
    vector.region_id = static_cast<std::uint16_t>(r);
    vector.magnitude = magnitude;
    vector.frame_index = frame_index_;
    vector.timestamp_ms = timestamp_ms;
    batch.push_back(vector);
  }

  ++frame_index_;
  return batch;
}

void CsvMotionSource::rewind() {
  input_.clear();
  input_.seekg(0, std::ios::beg);
  std::string header;
  std::getline(input_, header);
  exhausted_ = false;
}

}  // namespace res_agent::motion
