#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace res_agent::sinks {
namespace {

constexpr std::size_t kMetricCountBase = 29;
constexpr std::size_t kMetricCountHealth = 6;
constexpr std::size_t kMaxMetricCount = kMetricCountBase + kMetricCountHealth;
constexpr std::size_t kMaxCommandArgCount = 1 + (kMaxMetricCount * 3);

double sanitize_value(const float value) {
  return std::isfinite(value) ? static_cast<double>(value) : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

const char* const kServoMetrics[model::kCubeServoCount] = {
    "actuation:servo_1", "actuation:servo_2", "actuation:servo_3", "actuation:servo_4", "actuation:servo_5",
};

}  // namespace

const std::vector<std::string>& RedisTsSink::known_metrics() {
  static const std::vector<std::string> kMetricSuffixes = {
      "reservoir:state_norm",
      "reservoir:state_mean",
      "reservoir:sequence",
      "reservoir:degraded_reemits",
      "reservoir:node_state",
      "link:sent",
      "link:retransmits",
      "link:acked",
      "link:exhausted",
      "link:duplicates",
      "link:gap_skips",
      "link:decode_errors",
      "link:queue_depth",
      "readout:accuracy",
      "readout:precision",
      "readout:recall",
      "readout:f1",
      "readout:train_size",
      "readout:test_size",
      "readout:updates_performed",
      "readout:examples_buffered",
      "actuation:servo_1",
      "actuation:servo_2",
      "actuation:servo_3",
      "actuation:servo_4",
      "actuation:servo_5",
      "actuation:clock",
      "actuation:wave_level",
      "actuation:failures",
      "agent:heartbeat",
      "agent:loop_jitter",
      "agent:compute_time",
      "agent:redis_latency",
      "agent:redis_errors",
      "agent:missed_cycles",
  };
  return kMetricSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  enabled_metrics_ = options_.enabled_metrics.empty() ? known_metrics() : options_.enabled_metrics;
  enabled_metric_set_ = std::unordered_set<std::string>(enabled_metrics_.begin(), enabled_metrics_.end());
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }
  if (!ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : enabled_metrics_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(model::telemetry_frame& frame) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(frame)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(frame);
}

bool RedisTsSink::publish_impl(model::telemetry_frame& frame) {
  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    if (enabled_metric_set_.find(suffix) == enabled_metric_set_.end()) {
      return;
    }
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, value);
  };

  append_metric("reservoir:state_norm", sanitize_value(frame.state_norm));
  append_metric("reservoir:state_mean", sanitize_value(frame.state_mean));
  append_metric("reservoir:sequence", static_cast<double>(frame.state_sequence));
  append_metric("reservoir:degraded_reemits", static_cast<double>(frame.degraded_reemits));
  append_metric("reservoir:node_state", static_cast<double>(static_cast<std::uint8_t>(frame.state)));
  append_metric("link:sent", static_cast<double>(frame.link.sent));
  append_metric("link:retransmits", static_cast<double>(frame.link.retransmits));
  append_metric("link:acked", static_cast<double>(frame.link.acked));
  append_metric("link:exhausted", static_cast<double>(frame.link.exhausted));
  append_metric("link:duplicates", static_cast<double>(frame.link.duplicates));
  append_metric("link:gap_skips", static_cast<double>(frame.link.gap_skips));
  append_metric("link:decode_errors", static_cast<double>(frame.link.decode_errors));
  append_metric("link:queue_depth", static_cast<double>(frame.link.queue_depth));
  append_metric("readout:accuracy", sanitize_value(frame.accuracy));
  append_metric("readout:precision", sanitize_value(frame.precision));
  append_metric("readout:recall", sanitize_value(frame.recall));
  append_metric("readout:f1", sanitize_value(frame.f1));
  append_metric("readout:train_size", static_cast<double>(frame.train_size));
  append_metric("readout:test_size", static_cast<double>(frame.test_size));
  append_metric("readout:updates_performed", static_cast<double>(frame.updates_performed));
  append_metric("readout:examples_buffered", static_cast<double>(frame.examples_buffered));
  for (std::size_t i = 0; i < model::kCubeServoCount; ++i) {
    append_metric(kServoMetrics[i], sanitize_value(frame.servo_angle[i]));
  }
  append_metric("actuation:clock", sanitize_value(frame.clock_angle));
  append_metric("actuation:wave_level", static_cast<double>(frame.wave_level));
  append_metric("actuation:failures", static_cast<double>(frame.actuator_failures));

  if (options_.publish_health) {
    append_metric("agent:heartbeat", static_cast<double>(frame.agent.heartbeat_ms));
    append_metric("agent:loop_jitter", sanitize_value(frame.agent.loop_jitter_ms));
    append_metric("agent:compute_time", sanitize_value(frame.agent.compute_time_ms));
    append_metric("agent:redis_latency", sanitize_value(frame.agent.redis_latency_ms));
    append_metric("agent:redis_errors", static_cast<double>(frame.agent.redis_errors));
    append_metric("agent:missed_cycles", static_cast<double>(frame.agent.missed_cycles));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = std::chrono::steady_clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  const auto publish_end = std::chrono::steady_clock::now();
  frame.agent.redis_latency_ms =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(publish_end - publish_start).count();
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

}  // namespace res_agent::sinks
