#pragma once

#include <cstdint>
#include <string>

namespace pmatrix::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"pmatrix"};
  std::uint32_t connect_timeout_ms{1000};
  bool enabled{false};
};

struct EncoderConfig {
  std::string emitter_id{"default"};
  int output_indent{2};
  RedisConfig redis{};
};

EncoderConfig load_encoder_config(const std::string& path);

// Redis list holding the record stream attributed to config.emitter_id.
std::string stream_key(const EncoderConfig& config);

}  // namespace pmatrix::core
