#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pktlib/packet/checksum.hpp"
#include "pktlib/packet/codec.hpp"
#include "pktlib/utils/config_loader.hpp"
#include "pktlib/utils/log_config.hpp"

using namespace pktlib::packet;
using namespace pktlib::utils;

static bool read_all(const std::filesystem::path& p, std::vector<std::uint8_t>& out) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return false;
  out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

static void usage() {
  std::cerr << "Usage: pkt_decode <file> [--verify] [--config <file>]\n";
}

int main(int argc, char** argv) {
  std::string path;
  std::string config_path;
  bool verify = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--verify") verify = true;
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "-h" || a == "--help") { usage(); return 2; }
    else if (path.empty() && a.rfind("--", 0) != 0) path = a;
    else { std::cerr << "Unknown arg: " << a << "\n"; usage(); return 2; }
  }
  if (path.empty()) { usage(); return 2; }

  ConfigLoader config;
  if (!config_path.empty()) {
    if (auto ec = config.load_from_file(config_path)) {
      std::cerr << "config error: " << config_path << ": " << ec.message() << "\n";
      return 2;
    }
  }
  config.load_from_environment("PKTLIB_", {"log.level", "log.file"});
  log_utils::setup_logging_from_config(config);
  auto logger = LogManager::instance().get_logger("pkt_decode");

  std::vector<std::uint8_t> bytes;
  if (!read_all(path, bytes)) {
    std::cerr << "failed to read file: " << path << "\n";
    return 1;
  }
  PKTLIB_LOG_DEBUG(logger, "read " + std::to_string(bytes.size()) + " bytes from " + path);

  auto res = decode_packet(bytes);
  if (!res) {
    std::cerr << "decode error: " << res.error().message() << "\n";
    return 1;
  }
  const Packet& p = res.value();

  nlohmann::json j;
  j["message_type"] = p.header().message_type;
  j["sequence"] = p.header().sequence;
  j["sender_id"] = p.header().sender_id;
  j["payload_size"] = p.header().payload_size;
  j["checksum"] = p.header().checksum;
  int rc = 0;
  if (verify) {
    bool ok = verify_checksum(p);
    j["checksum_valid"] = ok;
    if (!ok) {
      PKTLIB_LOG_WARNING(logger, "checksum mismatch: header=" + std::to_string(p.header().checksum) +
                                 " payload=" + std::to_string(calc_checksum(p.payload())));
      rc = 3;
    }
  }
  std::cout << j.dump(2) << "\n";
  LogManager::instance().flush_all();
  return rc;
}
