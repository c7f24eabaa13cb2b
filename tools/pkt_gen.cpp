#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "pktlib/packet/codec.hpp"
#include "pktlib/utils/config_loader.hpp"
#include "pktlib/utils/log_config.hpp"

using namespace pktlib::packet;
using namespace pktlib::utils;

struct GenArgs {
  std::optional<uint64_t> type;
  uint32_t sequence = 0;
  std::optional<uint64_t> sender;
  std::optional<std::string> payload_hex;
  std::optional<std::string> payload_file;
  std::string config;
  std::string out;
};

static void usage() {
  std::cout << "Usage: pkt_gen [--type N] [--seq N] [--sender N] "
               "[--payload-hex HEX | --payload-file <file>] [--config <file>] --out <file>\n";
}

static std::optional<uint64_t> parse_u64(const std::string& s) {
  if (s.empty() || s[0] == '-') return std::nullopt;
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), &end, 0);
  if (errno != 0 || *end != '\0') return std::nullopt;
  return static_cast<uint64_t>(v);
}

static bool parse_args(int argc, char** argv, GenArgs& args) {
  int i = 1;
  auto next = [&](const char* err) -> const char* {
    if (i + 1 >= argc) { std::cerr << err << "\n"; return static_cast<const char*>(nullptr); }
    return argv[++i];
  };
  auto number = [](const char* v, const char* name) -> std::optional<uint64_t> {
    auto n = parse_u64(v);
    if (!n) std::cerr << name << " must be an unsigned integer\n";
    return n;
  };
  for (; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--type") {
      const char* v = next("--type needs value"); if (!v) return false;
      args.type = number(v, "--type"); if (!args.type) return false;
      if (*args.type > 0xFFu) { std::cerr << "--type must fit in 8 bits\n"; return false; }
    } else if (a == "--seq") {
      const char* v = next("--seq needs value"); if (!v) return false;
      auto n = number(v, "--seq"); if (!n) return false;
      if (*n > 0xFFFFFFFFu) { std::cerr << "--seq must fit in 32 bits\n"; return false; }
      args.sequence = static_cast<uint32_t>(*n);
    } else if (a == "--sender") {
      const char* v = next("--sender needs value"); if (!v) return false;
      args.sender = number(v, "--sender"); if (!args.sender) return false;
    }
    else if (a == "--payload-hex") { const char* v = next("--payload-hex needs value"); if (!v) return false; args.payload_hex = std::string(v); }
    else if (a == "--payload-file") { const char* v = next("--payload-file needs value"); if (!v) return false; args.payload_file = std::string(v); }
    else if (a == "--config") { const char* v = next("--config needs value"); if (!v) return false; args.config = v; }
    else if (a == "--out") { const char* v = next("--out needs value"); if (!v) return false; args.out = v; }
    else if (a == "-h" || a == "--help") { usage(); return false; }
    else { std::cerr << "Unknown arg: " << a << "\n"; return false; }
  }
  if (args.payload_hex && args.payload_file) { std::cerr << "--payload-hex and --payload-file are exclusive\n"; return false; }
  if (args.out.empty()) { std::cerr << "--out required\n"; return false; }
  return true;
}

static std::optional<std::vector<std::uint8_t>> decode_hex(const std::string& hex) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  if (hex.size() % 2 != 0) return std::nullopt;
  std::vector<std::uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

static bool read_all(const std::filesystem::path& p, std::vector<std::uint8_t>& out) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return false;
  out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

int main(int argc, char** argv) {
  GenArgs g;
  if (!parse_args(argc, argv, g)) return 2;

  ConfigLoader config;
  if (!g.config.empty()) {
    if (auto ec = config.load_from_file(g.config)) {
      std::cerr << "config error: " << g.config << ": " << ec.message() << "\n";
      return 2;
    }
  }
  config.load_from_environment("PKTLIB_", {"log.level", "log.file", "packet.default_type", "packet.default_sender"});
  log_utils::setup_logging_from_config(config);
  auto logger = LogManager::instance().get_logger("pkt_gen");

  std::vector<std::uint8_t> payload;
  if (g.payload_hex) {
    auto bytes = decode_hex(*g.payload_hex);
    if (!bytes) { PKTLIB_LOG_ERROR(logger, "invalid hex payload"); return 2; }
    payload = std::move(*bytes);
  } else if (g.payload_file) {
    if (!read_all(*g.payload_file, payload)) {
      PKTLIB_LOG_ERROR(logger, "failed to read payload file: " + *g.payload_file);
      return 1;
    }
  }
  if (payload.size() > 0xFFFFFFFFull) {
    PKTLIB_LOG_ERROR(logger, "payload too large");
    return 2;
  }

  int64_t cfg_type = config.get_int("packet.default_type", 0);
  int64_t cfg_sender = config.get_int("packet.default_sender", 0);
  if (!g.type && (cfg_type < 0 || cfg_type > 0xFF)) {
    PKTLIB_LOG_ERROR(logger, "packet.default_type out of range: " + std::to_string(cfg_type));
    return 2;
  }
  if (!g.sender && cfg_sender < 0) {
    PKTLIB_LOG_ERROR(logger, "packet.default_sender out of range: " + std::to_string(cfg_sender));
    return 2;
  }
  uint8_t type = static_cast<uint8_t>(g.type.value_or(static_cast<uint64_t>(cfg_type)));
  uint64_t sender = g.sender.value_or(static_cast<uint64_t>(cfg_sender));

  Packet p(type, g.sequence, sender, std::move(payload));
  auto data = encode_packet(p);

  std::ofstream ofs(g.out, std::ios::binary);
  ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  // flush 時の失敗も含めて判定
  ofs.close();
  if (!ofs) {
    PKTLIB_LOG_ERROR(logger, "failed to write " + g.out);
    return 1;
  }
  logger->log_with_metadata(LogLevel::Info, "packet written",
                            {{"bytes", std::to_string(data.size())},
                             {"checksum", std::to_string(p.header().checksum)},
                             {"out", g.out}});
  std::cout << "wrote " << data.size() << " bytes to " << g.out << "\n";
  LogManager::instance().flush_all();
  return 0;
}
