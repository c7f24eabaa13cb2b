#pragma once

#include <string>
#include <system_error>

namespace pktlib {

enum class PktErrc {
  ok = 0,
  insufficient_bytes = 1,
  payload_size_mismatch = 2,
  io_error = 3,
  invalid_argument = 4,
};

class PktErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "pktlib"; }
  std::string message(int ev) const override {
    switch (static_cast<PktErrc>(ev)) {
      case PktErrc::ok: return "ok";
      case PktErrc::insufficient_bytes: return "insufficient bytes";
      case PktErrc::payload_size_mismatch: return "payload size mismatch";
      case PktErrc::io_error: return "I/O error";
      case PktErrc::invalid_argument: return "invalid argument";
      default: return "unknown error";
    }
  }

  // 汎用の std::errc と比較できるようにする（ec == std::errc::io_error など）
  std::error_condition default_error_condition(int ev) const noexcept override {
    switch (static_cast<PktErrc>(ev)) {
      case PktErrc::insufficient_bytes:
      case PktErrc::payload_size_mismatch: return std::errc::bad_message;
      case PktErrc::io_error: return std::errc::io_error;
      case PktErrc::invalid_argument: return std::errc::invalid_argument;
      default: return std::error_condition(ev, *this);
    }
  }
};

inline const std::error_category& pkt_error_category() {
  static PktErrorCategory cat;
  return cat;
}

inline std::error_code make_error_code(PktErrc e) {
  return {static_cast<int>(e), pkt_error_category()};
}

} // namespace pktlib

namespace std {
template<> struct is_error_code_enum<pktlib::PktErrc> : true_type {};
}
