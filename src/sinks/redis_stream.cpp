#include "sinks/redis_stream.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <hiredis/hiredis.h>

#include "codec/record_json.hpp"
#include "core/errors.hpp"

namespace pmatrix::sinks {

RedisRecordStream::RedisRecordStream(RedisStreamOptions options) : options_(std::move(options)) {}

RedisRecordStream::~RedisRecordStream() = default;

RedisRecordStream::RedisRecordStream(RedisRecordStream&&) noexcept = default;
RedisRecordStream& RedisRecordStream::operator=(RedisRecordStream&&) noexcept = default;

void RedisRecordStream::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisRecordStream::check_connectivity() {
  return ensure_connected();
}

bool RedisRecordStream::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisRecordStream::reconnect() {
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
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisRecordStream::authenticate() {
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

bool RedisRecordStream::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisRecordStream::append(const model::RuntimeStateRecord& record) {
  if (!ensure_connected()) {
    return false;
  }

  const std::string payload = codec::dump_record(record, -1);
  if (append_impl(payload)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return append_impl(payload);
}

bool RedisRecordStream::append_impl(const std::string& payload) {
  const char* argv[] = {"RPUSH", options_.key.c_str(), payload.c_str()};
  const std::size_t argv_len[] = {5, options_.key.size(), payload.size()};

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), 3, argv, argv_len));
  if (reply == nullptr) {
    std::cerr << "[redis] RPUSH " << options_.key << " failed: no reply\n";
    return false;
  }

  const bool ok = reply->type == REDIS_REPLY_INTEGER;
  if (!ok) {
    std::cerr << "[redis] RPUSH " << options_.key << " failed: "
              << (reply->str != nullptr ? reply->str : "unexpected reply type") << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

std::vector<model::RuntimeStateRecord> RedisRecordStream::read_all() {
  if (!ensure_connected()) {
    throw std::runtime_error("redis unavailable; cannot read " + options_.key);
  }

  const char* argv[] = {"LRANGE", options_.key.c_str(), "0", "-1"};
  const std::size_t argv_len[] = {6, options_.key.size(), 1, 2};

  struct ReplyDeleter {
    void operator()(redisReply* reply) const {
      if (reply != nullptr) {
        freeReplyObject(reply);
      }
    }
  };
  const std::unique_ptr<redisReply, ReplyDeleter> reply(
      static_cast<redisReply*>(redisCommandArgv(context_.get(), 4, argv, argv_len)));

  if (reply == nullptr) {
    context_.reset();
    throw std::runtime_error("redis LRANGE " + options_.key + " failed: no reply");
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    const std::string reason = reply->str != nullptr ? reply->str : "unexpected reply type";
    throw std::runtime_error("redis LRANGE " + options_.key + " failed: " + reason);
  }

  std::vector<model::RuntimeStateRecord> records;
  records.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const redisReply* element = reply->element[i];
    if (element == nullptr || element->type != REDIS_REPLY_STRING) {
      throw std::runtime_error("redis LRANGE " + options_.key + ": element " + std::to_string(i) +
                               " is not a string");
    }
    try {
      records.push_back(codec::parse_record(std::string_view(element->str, element->len)));
    } catch (const core::DecodeError& ex) {
      throw core::DecodeError(options_.key + "[" + std::to_string(i) + "]: " + ex.what());
    }
  }
  return records;
}

}  // namespace pmatrix::sinks
