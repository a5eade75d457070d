#ifndef TOOLKIT_ERRORSX_DESCRIBABLE_HPP
#define TOOLKIT_ERRORSX_DESCRIBABLE_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace toolkit::errorsx {

// ===========================
// 可描述錯誤的能力
// ===========================

/// @brief 具有 what() 的錯誤（std::exception 系列）
template <typename E>
concept HasWhat = requires(const E& e) {
  { e.what() } -> std::convertible_to<std::string_view>;
};

/// @brief 具有 message() 的錯誤（std::error_code、各模組自訂錯誤類別）
template <typename E>
concept HasMessage = requires(const E& e) {
  { e.message() } -> std::convertible_to<std::string_view>;
};

/// @brief 攜帶 std::error_code 的錯誤（std::system_error 等）
template <typename E>
concept HasErrorCode = requires(const E& e) {
  { e.code() } -> std::convertible_to<std::error_code>;
};

/// @brief 能產生文字描述的錯誤
/// @details 這是 cause chain 接受外部錯誤的唯一要求，不需繼承任何基底類別
template <typename E>
concept Describable = HasWhat<E> || HasMessage<E>;

/// @brief 取得錯誤的文字描述
/// @note what() 優先於 message()，std::system_error 的 what() 已包含錯誤碼訊息
/// @note what() 返回 nullptr 時視為空描述
template <Describable E>
[[nodiscard]] std::string describe(const E& e) {
  if constexpr (HasWhat<E>) {
    if constexpr (std::is_pointer_v<decltype(e.what())>) {
      const char* what = e.what();
      return what != nullptr ? std::string(what) : std::string();
    } else {
      return std::string(std::string_view(e.what()));
    }
  } else {
    return std::string(e.message());
  }
}

/// @brief 取得錯誤攜帶的 std::error_code
/// @return 沒有錯誤碼時返回 std::nullopt
template <Describable E>
[[nodiscard]] std::optional<std::error_code> code_of(const E& e) noexcept {
  if constexpr (std::same_as<E, std::error_code>) {
    return e;
  } else if constexpr (HasErrorCode<E>) {
    return std::error_code(e.code());
  } else {
    return std::nullopt;
  }
}

}  // namespace toolkit::errorsx

#endif
