#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pmatrix::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(EncoderConfig& config, const std::string& key, const std::string& value) {
  if (key == "emitter.id") {
    if (value.empty()) {
      throw std::runtime_error("emitter.id must not be empty");
    }
    config.emitter_id = value;
    return;
  }

  if (key == "output.indent") {
    const auto indent = std::stoi(value);
    if (indent < 0 || indent > 8) {
      throw std::runtime_error("output.indent must be in range 0..8");
    }
    config.output_indent = indent;
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = db;
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    const auto timeout = std::stoll(value);
    if (timeout <= 0) {
      throw std::runtime_error("redis.connect_timeout_ms must be greater than 0");
    }
    config.redis.connect_timeout_ms = static_cast<std::uint32_t>(timeout);
  }
}

}  // namespace

EncoderConfig load_encoder_config(const std::string& path) {
  EncoderConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    sections.resize(depth);

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::logic_error&) {
      // std::stoi and friends report bad numbers as invalid_argument/out_of_range.
      throw std::runtime_error("invalid value for " + full_key.str() + ": " + value);
    }
  }

  return config;
}

std::string stream_key(const EncoderConfig& config) {
  return config.redis.key_prefix + ":" + config.emitter_id + ":records";
}

}  // namespace pmatrix::core
