#ifndef TOOLKIT_ERROR_HPP
#define TOOLKIT_ERROR_HPP

#include <expected>
#include <source_location>
#include <string>
#include <utility>

#include "toolkit/errorsx/error.hpp"

namespace toolkit {

/// @brief 可能失敗調用的標準回傳類型別名
/// @tparam T 成功的數值類型，預設為 void
///
template <typename T = void>
using Result = std::expected<T, errorsx::ErrorValue>;

/// @brief 在錯誤源頭產生只有訊息的錯誤結果
/// @param message 錯誤描述
/// @param loc 自動捕捉呼叫處的原始碼位置
/// @return 一個封裝了 ErrorValue 的 std::unexpected
///
[[nodiscard]] inline auto fail(
    std::string message,
    std::source_location loc = std::source_location::current()) noexcept {
  return std::unexpected(errorsx::ErrorValue::from(std::move(message), loc));
}

/// @brief 將已建立的錯誤（通常包裝了下層錯誤）轉為錯誤結果
///
[[nodiscard]] inline auto fail(errorsx::ErrorValue error) noexcept {
  return std::unexpected(std::move(error));
}

}  // namespace toolkit

#endif
