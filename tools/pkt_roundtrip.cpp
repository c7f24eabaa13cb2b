#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "pktlib/packet/checksum.hpp"
#include "pktlib/packet/codec.hpp"
#include "pktlib/utils/config_loader.hpp"
#include "pktlib/utils/log_config.hpp"

using namespace pktlib::packet;
using namespace pktlib::utils;

struct Args {
  uint64_t count = 1000;
  uint64_t max_payload = 512;
  std::optional<uint64_t> seed;
};

static std::optional<uint64_t> parse_u64(const std::string& s) {
  if (s.empty() || s[0] == '-') return std::nullopt;
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), &end, 0);
  if (errno != 0 || *end != '\0') return std::nullopt;
  return static_cast<uint64_t>(v);
}

static bool parse_args(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "--count" || a == "--max-payload" || a == "--seed") && i + 1 < argc) {
      auto n = parse_u64(argv[++i]);
      if (!n) { std::cerr << a << " must be an unsigned integer\n"; return false; }
      if (a == "--count") args.count = *n;
      else if (a == "--max-payload") args.max_payload = *n;
      else args.seed = *n;
    } else {
      std::cerr << "Usage: pkt_roundtrip [--count N] [--max-payload N] [--seed N]\n";
      return false;
    }
  }
  return true;
}

// 1パケット分: 生成 -> エンコード -> デコード -> 比較
static bool check_one(std::mt19937_64& rng, uint64_t max_payload, std::string& why) {
  std::uniform_int_distribution<uint64_t> size_dist(0, max_payload);
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::vector<std::uint8_t> payload(static_cast<size_t>(size_dist(rng)));
  for (auto& b : payload) b = static_cast<std::uint8_t>(byte_dist(rng));

  const auto type = static_cast<uint8_t>(rng() & 0xFFu);
  const auto seq = static_cast<uint32_t>(rng());
  const uint64_t sender = rng();
  Packet original(type, seq, sender, payload);

  auto bytes = encode_packet(original);
  if (bytes.size() != kHeaderSize + payload.size()) { why = "unexpected encoded size"; return false; }

  auto res = decode_packet(bytes);
  if (!res) { why = res.error().message(); return false; }
  const Packet& decoded = res.value();
  if (!(decoded.header() == original.header())) { why = "header mismatch"; return false; }
  if (decoded.payload() != payload) { why = "payload mismatch"; return false; }
  if (!verify_checksum(decoded)) { why = "checksum mismatch"; return false; }
  return true;
}

int main(int argc, char** argv) {
  Args args;
  if (!parse_args(argc, argv, args)) return 2;

  ConfigLoader config;
  config.load_from_environment("PKTLIB_", {"log.level", "log.file"});
  log_utils::setup_logging_from_config(config);
  auto logger = LogManager::instance().get_logger("pkt_roundtrip");

  const uint64_t seed = args.seed.value_or(static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count()));
  std::mt19937_64 rng(seed);
  PKTLIB_LOG_INFO(logger, "seed=" + std::to_string(seed) + " count=" + std::to_string(args.count));

  uint64_t failures = 0;
  for (uint64_t i = 0; i < args.count; ++i) {
    std::string why;
    if (!check_one(rng, args.max_payload, why)) {
      ++failures;
      PKTLIB_LOG_ERROR(logger, "iteration " + std::to_string(i) + ": " + why);
    }
  }

  std::cout << (args.count - failures) << "/" << args.count << " packets survived round trip\n";
  LogManager::instance().flush_all();
  return failures == 0 ? 0 : 1;
}
