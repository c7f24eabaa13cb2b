#pragma once

#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace pktlib {

/**
 * @brief デコード結果: 値か std::error_code のどちらか一方
 *
 * 戻り値を捨てるとコンパイラが警告する。エラー状態で value() を呼ぶと
 * その error_code を持つ std::system_error を投げる。
 */
template<typename T>
class [[nodiscard]] Result {
  static_assert(!std::is_same_v<T, std::error_code>, "Result<std::error_code> is ambiguous");

public:
  Result(const T& value) : state_(std::in_place_index<0>, value) {}
  Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
  Result(std::error_code ec) : state_(std::in_place_index<1>, ec) {}

  bool has_value() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  const T& value() const& {
    ensure_value();
    return *std::get_if<0>(&state_);
  }
  T& value() & {
    ensure_value();
    return *std::get_if<0>(&state_);
  }
  T&& value() && {
    ensure_value();
    return std::move(*std::get_if<0>(&state_));
  }

  // 成功時は空の error_code
  std::error_code error() const noexcept {
    if (const auto* ec = std::get_if<1>(&state_)) return *ec;
    return {};
  }

private:
  std::variant<T, std::error_code> state_;

  void ensure_value() const {
    if (const auto* ec = std::get_if<1>(&state_)) throw std::system_error(*ec);
  }
};

} // namespace pktlib
