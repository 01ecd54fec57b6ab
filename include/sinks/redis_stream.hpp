#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/runtime_state.hpp"

struct redisContext;

namespace pmatrix::sinks {

struct RedisStreamOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key{"pmatrix:default:records"};
  std::uint32_t connect_timeout_ms{1000};
};

// One Redis list per emitter; list order is emission order.
class RedisRecordStream {
 public:
  explicit RedisRecordStream(RedisStreamOptions options = {});
  ~RedisRecordStream();

  RedisRecordStream(const RedisRecordStream&) = delete;
  RedisRecordStream& operator=(const RedisRecordStream&) = delete;
  RedisRecordStream(RedisRecordStream&&) noexcept;
  RedisRecordStream& operator=(RedisRecordStream&&) noexcept;

  bool check_connectivity();

  // RPUSH of the compact JSON encoding. Failures are logged, never thrown.
  bool append(const model::RuntimeStateRecord& record);

  // Throws std::runtime_error when the list cannot be read and
  // core::DecodeError when an element is not a valid record.
  std::vector<model::RuntimeStateRecord> read_all();

  const RedisStreamOptions& options() const { return options_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool append_impl(const std::string& payload);

  RedisStreamOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace pmatrix::sinks
