#ifndef TOOLKIT_ERRORSX_ERROR_HPP
#define TOOLKIT_ERRORSX_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "toolkit/errorsx/describable.hpp"

namespace toolkit::errorsx {

class ErrorBuilder;

/// @brief 結構化錯誤值，封裝訊息、上下文、狀態碼與來源錯誤
/// @details
/// ErrorValue 由 ErrorBuilder::build() 產生，建立後不可修改。
/// 每一層錯誤獨佔至多一個 cause，形成單向、無環的 cause chain：
/// - message：失敗描述（必填）
/// - context：失敗當下正在進行的操作
/// - status_code / status：HTTP 風格的狀態碼與狀態文字
/// - code：可供程式判斷的 std::error_code
/// - location：build() 被呼叫的原始碼位置
///
/// @note 此類設計為 move-only，建立後可安全地被多執行緒以 const 方式讀取
///
/// @example
/// ```cpp
/// auto err = ErrorValue::builder("Failed to process file")
///                .with_context("Processing user upload")
///                .with_source(std::system_error(errno, std::generic_category()))
///                .with_status_code(500)
///                .build();
/// ```
class ErrorValue {
 private:
  std::string message_;                           ///< 錯誤訊息
  std::optional<std::string> context_;            ///< 上下文描述
  std::optional<std::uint32_t> status_code_;      ///< 狀態碼
  std::optional<std::string> status_;             ///< 狀態文字
  std::optional<std::error_code> code_;           ///< 錯誤碼
  std::optional<std::source_location> location_;  ///< build() 位置
  std::unique_ptr<ErrorValue> cause_;             ///< 來源錯誤

  explicit ErrorValue(std::string message) noexcept
      : message_(std::move(message)) {}

  /// @brief 將外部錯誤正規化為葉節點（無位置資訊）
  static ErrorValue from_native(std::string description,
                                std::optional<std::error_code> code) noexcept;

  friend class ErrorBuilder;

 public:
  /// @brief render() 中各層之間的分隔字串
  static constexpr std::string_view CAUSE_SEPARATOR = "; caused by: ";

  // ===========================
  // 工廠方法
  // ===========================

  /// @brief 建立 builder
  /// @param message 錯誤訊息
  /// @pre message 不可為空字串（呼叫端的邏輯錯誤，不做執行期檢查）
  [[nodiscard]] static ErrorBuilder builder(std::string message) noexcept;

  /// @brief 建立只有訊息的錯誤，等同 builder(message).build()
  [[nodiscard]] static ErrorValue from(
      std::string message,
      std::source_location loc = std::source_location::current()) noexcept;

  /// @brief 從當前 errno 建立錯誤（generic_category）
  /// @note 呼叫時機：系統調用失敗後立即呼叫，以捕獲正確的 errno
  [[nodiscard]] static ErrorValue from_errno(
      std::string message,
      std::source_location loc = std::source_location::current()) noexcept;

  /// @brief 從 std::error_code 建立錯誤
  [[nodiscard]] static ErrorValue from_code(
      std::error_code code, std::string message,
      std::source_location loc = std::source_location::current()) noexcept;

  // ===========================
  // RAII
  // ===========================
  ErrorValue(const ErrorValue& other) = delete;
  ErrorValue& operator=(const ErrorValue& other) = delete;
  ErrorValue(ErrorValue&& other) noexcept = default;
  ErrorValue& operator=(ErrorValue&& other) noexcept = default;
  ~ErrorValue() = default;

  // ===========================
  // 訪問器
  // ===========================

  [[nodiscard]] std::string_view message() const noexcept { return message_; }

  [[nodiscard]] std::optional<std::string_view> context() const noexcept {
    if (!context_) return std::nullopt;
    return std::string_view(*context_);
  }

  [[nodiscard]] std::optional<std::uint32_t> status_code() const noexcept {
    return status_code_;
  }

  [[nodiscard]] std::optional<std::string_view> status() const noexcept {
    if (!status_) return std::nullopt;
    return std::string_view(*status_);
  }

  [[nodiscard]] std::optional<std::error_code> code() const noexcept {
    return code_;
  }

  /// @brief 取得 build() 的呼叫位置
  /// @return 由外部錯誤正規化而來的節點沒有位置資訊
  [[nodiscard]] std::optional<std::source_location> location() const noexcept {
    return location_;
  }

  /// @brief 取得來源錯誤
  /// @return 唯讀指標，沒有來源錯誤時為 nullptr；所有權仍屬於本物件
  [[nodiscard]] const ErrorValue* cause() const noexcept {
    return cause_.get();
  }

  /// @brief 取得 cause chain 最底層的錯誤（葉節點返回自身）
  [[nodiscard]] const ErrorValue& root_cause() const noexcept;

  /// @brief cause chain 的層數（葉節點為 1）
  [[nodiscard]] std::size_t depth() const noexcept;

  // ===========================
  // 錯誤檢查
  // ===========================

  /// @brief 檢查 cause chain 中任一層是否帶有指定錯誤碼（完全相等）
  [[nodiscard]] bool is(std::error_code ec) const noexcept;

  /// @brief 檢查 cause chain 中任一層是否對應指定錯誤條件
  /// @details 以 error_condition 比對，system_category 的 errno 也能匹配
  [[nodiscard]] bool is(std::errc ec) const noexcept;

  /// @tparam Errc 錯誤碼枚舉類型（需滿足 std::is_error_code_enum）
  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  [[nodiscard]] bool is(Errc ec) const noexcept {
    return is(std::error_code(make_error_code(ec)));
  }

  // ===========================
  // 輸出
  // ===========================

  /// @brief 單行輸出，由外而內逐層以 CAUSE_SEPARATOR 串接
  /// @details 格式範例：
  ///   "parse failed (context: reading config) [400 Bad Request]; caused by:
  ///   No such file or directory {generic:2}"
  [[nodiscard]] std::string render() const;

  /// @brief 多行樹狀輸出，包含每一層的位置資訊
  [[nodiscard]] std::string render_verbose() const;
};

/// @brief 一次性的 ErrorValue 建構器
/// @details
/// 所有方法皆為右值限定，消耗自身並返回新的 builder，
/// 因此只能以鏈式呼叫或 std::move 的方式使用，build() 之後不可再使用。
/// 同一欄位多次設定時以最後一次為準。
class ErrorBuilder {
 private:
  ErrorValue value_;

  explicit ErrorBuilder(std::string message) noexcept
      : value_(std::move(message)) {}

  friend class ErrorValue;

 public:
  ErrorBuilder(const ErrorBuilder& other) = delete;
  ErrorBuilder& operator=(const ErrorBuilder& other) = delete;
  ErrorBuilder(ErrorBuilder&& other) noexcept = default;
  ErrorBuilder& operator=(ErrorBuilder&& other) noexcept = default;
  ~ErrorBuilder() = default;

  /// @brief 設定上下文（覆寫，不累加）
  [[nodiscard]] ErrorBuilder with_context(std::string context) && noexcept;

  /// @brief 設定狀態碼，不做範圍檢查
  [[nodiscard]] ErrorBuilder with_status_code(std::uint32_t code) && noexcept;

  /// @brief 設定狀態文字，與狀態碼彼此獨立
  [[nodiscard]] ErrorBuilder with_status(std::string status) && noexcept;

  /// @brief 設定可供 is() 判斷的錯誤碼
  [[nodiscard]] ErrorBuilder with_code(std::error_code code) && noexcept;

  /// @brief 附加已建立完成的 ErrorValue 作為來源錯誤，保留其 cause chain
  [[nodiscard]] ErrorBuilder with_source(ErrorValue source) &&;

  /// @brief 附加外部錯誤作為來源錯誤
  /// @details 以 describe() 的結果作為訊息正規化為葉節點；
  ///          若外部錯誤攜帶 std::error_code 則一併保留
  template <typename E>
    requires Describable<std::remove_cvref_t<E>> &&
             (!std::same_as<std::remove_cvref_t<E>, ErrorValue>)
  [[nodiscard]] ErrorBuilder with_source(E&& source) && {
    return std::move(*this).with_source(
        ErrorValue::from_native(describe(source), code_of(source)));
  }

  /// @brief 將處理中的例外附加為來源錯誤
  /// @note 只能在 catch 區塊內呼叫；沒有處理中的例外時不做任何事
  [[nodiscard]] ErrorBuilder with_current_exception() &&;

  /// @brief 完成建構並記錄呼叫位置
  /// @details 欄位移交給回傳的 ErrorValue，builder 之後處於 moved-from 狀態，
  ///          不可再呼叫任何方法
  /// @param loc 自動捕捉 build() 的呼叫位置
  [[nodiscard]] ErrorValue build(
      std::source_location loc = std::source_location::current()) && noexcept;
};

}  // namespace toolkit::errorsx

namespace toolkit {
using ErrorValue = errorsx::ErrorValue;
using ErrorBuilder = errorsx::ErrorBuilder;

}  // namespace toolkit

#endif
