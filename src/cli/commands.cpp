#include "cli/commands.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "codec/record_json.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "emit/emitter.hpp"
#include "sinks/redis_stream.hpp"
#include "validation/invariants.hpp"

namespace pmatrix::cli {
namespace {

struct Args {
  std::string command;
  std::optional<double> baseline;
  std::optional<double> norm;
  std::optional<double> stability;
  std::optional<double> meta_control;
  std::optional<std::uint64_t> timestamp;
  std::optional<std::string> config_path;
  std::optional<std::string> input_path;
  bool publish{false};
  bool from_redis{false};
  bool help{false};
};

// NaN and infinity parse successfully; the emitter rejects them with the field name.
bool parse_double(const char* s, double* out) {
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') {
    return false;
  }
  *out = v;
  return true;
}

bool parse_u64(const char* s, std::uint64_t* out) {
  if (*s == '\0' || *s == '-' || *s == '+') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) {
    return false;
  }
  *out = static_cast<std::uint64_t>(v);
  return true;
}

bool known_command(const std::string_view command) {
  return command == "emit" || command == "validate" || command == "validate-stream";
}

bool flag_applies(const std::string_view command, const std::string_view flag) {
  if (command == "emit") {
    return flag == "--baseline" || flag == "--norm" || flag == "--stability" || flag == "--meta-control" ||
           flag == "--timestamp" || flag == "--publish" || flag == "--config";
  }
  if (command == "validate-stream") {
    return flag == "--from-redis" || flag == "--config";
  }
  return false;
}

bool parse_args(const int argc, const char* const* argv, Args& args, std::string& error) {
  if (argc < 2) {
    error = "missing command";
    return false;
  }

  args.command = argv[1];
  if (args.command == "--help" || args.command == "-h" || args.command == "help") {
    args.help = true;
    return true;
  }
  if (!known_command(args.command)) {
    error = "unknown command '" + args.command + "'";
    return false;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string_view flag = argv[i];
    const auto next = [&](const char** value) {
      if (i + 1 >= argc) {
        error = std::string(flag) + " requires a value";
        return false;
      }
      *value = argv[++i];
      return true;
    };
    const auto number = [&](std::optional<double>& target) {
      const char* value = nullptr;
      if (!next(&value)) {
        return false;
      }
      double parsed = 0.0;
      if (!parse_double(value, &parsed)) {
        error = std::string(flag) + " expects a number, got '" + value + "'";
        return false;
      }
      target = parsed;
      return true;
    };

    if (flag == "--help" || flag == "-h") {
      args.help = true;
      return true;
    }
    // "-" is the stdin placeholder, not a flag.
    const bool positional = flag == "-" || (!flag.empty() && flag.front() != '-');
    if (positional) {
      if (args.command == "emit" || args.input_path.has_value()) {
        error = "unexpected argument '" + std::string(flag) + "'";
        return false;
      }
      args.input_path = std::string(flag);
      continue;
    }
    if (!flag_applies(args.command, flag)) {
      error = std::string(flag) + " does not apply to " + args.command;
      return false;
    }
    if (flag == "--baseline") {
      if (!number(args.baseline)) {
        return false;
      }
      continue;
    }
    if (flag == "--norm") {
      if (!number(args.norm)) {
        return false;
      }
      continue;
    }
    if (flag == "--stability") {
      if (!number(args.stability)) {
        return false;
      }
      continue;
    }
    if (flag == "--meta-control") {
      if (!number(args.meta_control)) {
        return false;
      }
      continue;
    }
    if (flag == "--timestamp") {
      const char* value = nullptr;
      if (!next(&value)) {
        return false;
      }
      std::uint64_t parsed = 0;
      if (!parse_u64(value, &parsed)) {
        error = "--timestamp expects an unsigned integer, got '" + std::string(value) + "'";
        return false;
      }
      args.timestamp = parsed;
      continue;
    }
    if (flag == "--config") {
      const char* value = nullptr;
      if (!next(&value)) {
        return false;
      }
      args.config_path = value;
      continue;
    }
    if (flag == "--publish") {
      args.publish = true;
      continue;
    }
    if (flag == "--from-redis") {
      args.from_redis = true;
      continue;
    }

    error = "unexpected argument '" + std::string(flag) + "'";
    return false;
  }

  if (args.from_redis && args.input_path.has_value()) {
    error = "--from-redis cannot be combined with an input path";
    return false;
  }
  return true;
}

core::EncoderConfig load_config(const Args& args) {
  if (!args.config_path.has_value()) {
    return core::EncoderConfig{};
  }
  return core::load_encoder_config(*args.config_path);
}

sinks::RedisStreamOptions stream_options(const core::EncoderConfig& config) {
  sinks::RedisStreamOptions options{};
  options.host = config.redis.host;
  options.port = config.redis.port;
  options.unix_socket = config.redis.unix_socket;
  options.password = config.redis.password;
  options.db = config.redis.db;
  options.key = core::stream_key(config);
  options.connect_timeout_ms = config.redis.connect_timeout_ms;
  return options;
}

std::string read_input(const Args& args, std::istream& in) {
  if (!args.input_path.has_value() || *args.input_path == "-") {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  std::ifstream file(*args.input_path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("unable to open input file: " + *args.input_path);
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int run_emit(const Args& args, std::ostream& out, std::ostream& err) {
  const auto missing = [&err](const char* flag) {
    err << "[encoder] emit: " << flag << " is required\n";
    print_usage(err);
    return kExitUsage;
  };
  if (!args.baseline.has_value()) {
    return missing("--baseline");
  }
  if (!args.norm.has_value()) {
    return missing("--norm");
  }
  if (!args.stability.has_value()) {
    return missing("--stability");
  }
  if (!args.meta_control.has_value()) {
    return missing("--meta-control");
  }

  const core::EncoderConfig config = load_config(args);

  emit::EmitInputs inputs{};
  inputs.baseline = *args.baseline;
  inputs.norm = *args.norm;
  inputs.stability = *args.stability;
  inputs.meta_control = *args.meta_control;
  inputs.timestamp = args.timestamp;

  model::RuntimeStateRecord record{};
  try {
    record = emit::emit_demo_record(inputs);
  } catch (const core::Error& ex) {
    err << "[encoder] emit rejected: " << ex.what() << '\n';
    return kExitFailure;
  }

  out << codec::dump_record(record, config.output_indent) << '\n';

  if (args.publish) {
    if (!config.redis.enabled) {
      err << "[encoder] --publish requires redis.address in the config file\n";
      return kExitFailure;
    }
    sinks::RedisRecordStream stream(stream_options(config));
    if (!stream.append(record)) {
      err << "[encoder] failed to append record to " << stream.options().key << '\n';
      return kExitFailure;
    }
    err << "[encoder] appended record to " << stream.options().key << '\n';
  }

  return kExitOk;
}

int run_validate(const Args& args, std::istream& in, std::ostream& out, std::ostream& err) {
  model::RuntimeStateRecord record{};
  try {
    record = codec::parse_record(read_input(args, in));
  } catch (const core::DecodeError& ex) {
    err << "[encoder] decode error: " << ex.what() << '\n';
    err << "[encoder] input must be a runtime state record with exactly the eight canonical fields\n";
    return kExitDecodeFailure;
  }

  const auto results = validation::validate_all(record);
  bool all_passed = true;
  for (const auto& result : results) {
    all_passed = all_passed && result.passed;
    out << '[' << (result.passed ? "PASS" : "FAIL") << "] " << result.id << ": " << result.detail << '\n';
  }

  out << '\n';
  if (all_passed) {
    out << "Result: all invariants satisfied, record is conforming.\n";
    return kExitOk;
  }
  out << "Result: invariant violation(s) detected, record is malformed.\n";
  return kExitFailure;
}

int run_validate_stream(const Args& args, std::istream& in, std::ostream& out, std::ostream& err) {
  std::vector<model::RuntimeStateRecord> records;
  try {
    if (args.from_redis) {
      const core::EncoderConfig config = load_config(args);
      if (!config.redis.enabled) {
        err << "[encoder] --from-redis requires redis.address in the config file\n";
        return kExitFailure;
      }
      sinks::RedisRecordStream stream(stream_options(config));
      records = stream.read_all();
      err << "[encoder] read " << records.size() << " record(s) from " << stream.options().key << '\n';
    } else {
      records = codec::parse_record_lines(read_input(args, in));
    }
  } catch (const core::DecodeError& ex) {
    err << "[encoder] decode error: " << ex.what() << '\n';
    return kExitDecodeFailure;
  }

  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto results = validation::validate_all(records[i]);
    std::vector<std::string_view> failed;
    for (const auto& result : results) {
      if (!result.passed) {
        failed.push_back(result.id);
      }
    }

    out << "record[" << i << "] timestamp=" << records[i].timestamp << ' ';
    if (failed.empty()) {
      out << "conforming\n";
      continue;
    }
    out << "malformed (failed:";
    for (const auto id : failed) {
      out << ' ' << id;
    }
    out << ")\n";
  }

  const auto report = validation::validate_stream(records);
  if (report.t1_violation.has_value()) {
    const std::size_t index = *report.t1_violation;
    out << "[FAIL] INV-T1: record[" << index << "] timestamp=" << records[index].timestamp
        << " precedes record[" << (index - 1) << "] timestamp=" << records[index - 1].timestamp << '\n';
  } else {
    out << "[PASS] INV-T1: timestamps non-decreasing across " << report.record_count << " record(s)\n";
  }

  out << '\n';
  if (report.conforming()) {
    out << "Result: stream is conforming.\n";
    return kExitOk;
  }
  out << "Result: stream violation(s) detected.\n";
  return kExitFailure;
}

}  // namespace

void print_usage(std::ostream& os) {
  os << "usage:\n"
        "  pmatrix-encoder emit --baseline X --norm X --stability X --meta-control X\n"
        "                       [--timestamp SECONDS] [--publish] [--config PATH]\n"
        "  pmatrix-encoder validate [PATH|-]\n"
        "  pmatrix-encoder validate-stream [PATH|-]\n"
        "  pmatrix-encoder validate-stream --from-redis --config PATH\n"
        "\n"
        "Records are emitted with placeholder score aggregation for schema conformance only.\n";
}

int run(const int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
  Args args{};
  std::string error;
  if (!parse_args(argc, argv, args, error)) {
    err << "[encoder] " << error << '\n';
    print_usage(err);
    return kExitUsage;
  }

  if (args.help) {
    print_usage(out);
    return kExitOk;
  }

  try {
    if (args.command == "emit") {
      return run_emit(args, out, err);
    }
    if (args.command == "validate") {
      return run_validate(args, in, out, err);
    }
    if (args.command == "validate-stream") {
      return run_validate_stream(args, in, out, err);
    }
  } catch (const std::runtime_error& ex) {
    err << "[encoder] " << ex.what() << '\n';
    return kExitFailure;
  }

  return kExitUsage;
}

}  // namespace pmatrix::cli
