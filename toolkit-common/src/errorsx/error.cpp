#include "toolkit/errorsx/error.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <exception>
#include <iterator>
#include <vector>

namespace toolkit::errorsx {

namespace {

/// @brief 單行格式的一層：message (context: ...) [code text] {category:value}
void append_segment(std::string& out, const ErrorValue& level) {
  auto it = std::back_inserter(out);
  fmt::format_to(it, "{}", level.message());

  if (auto context = level.context()) {
    fmt::format_to(it, " (context: {})", *context);
  }

  auto status_code = level.status_code();
  auto status = level.status();
  if (status_code && status) {
    fmt::format_to(it, " [{} {}]", *status_code, *status);
  } else if (status_code) {
    fmt::format_to(it, " [{}]", *status_code);
  } else if (status) {
    fmt::format_to(it, " [{}]", *status);
  }

  if (auto code = level.code()) {
    fmt::format_to(it, " {{{}:{}}}", code->category().name(), code->value());
  }
}

/// @brief 多行格式中一層的明細列（不含訊息本身）
std::vector<std::string> details_of(const ErrorValue& level) {
  std::vector<std::string> details;

  if (auto context = level.context()) {
    details.push_back(fmt::format("context: {}", *context));
  }

  auto status_code = level.status_code();
  auto status = level.status();
  if (status_code && status) {
    details.push_back(fmt::format("status: {} {}", *status_code, *status));
  } else if (status_code) {
    details.push_back(fmt::format("status: {}", *status_code));
  } else if (status) {
    details.push_back(fmt::format("status: {}", *status));
  }

  if (auto code = level.code()) {
    details.push_back(fmt::format("code: [{}:{}] {}", code->category().name(),
                                  code->value(), code->message()));
  }

  if (auto loc = level.location()) {
    details.push_back(fmt::format("at: {}:{}", loc->file_name(), loc->line()));
  }

  return details;
}

}  // namespace

// ===========================
// ErrorValue
// ===========================

ErrorBuilder ErrorValue::builder(std::string message) noexcept {
  return ErrorBuilder(std::move(message));
}

ErrorValue ErrorValue::from(std::string message,
                            std::source_location loc) noexcept {
  return builder(std::move(message)).build(loc);
}

ErrorValue ErrorValue::from_errno(std::string message,
                                  std::source_location loc) noexcept {
  return builder(std::move(message))
      .with_code(std::error_code(errno, std::generic_category()))
      .build(loc);
}

ErrorValue ErrorValue::from_code(std::error_code code, std::string message,
                                 std::source_location loc) noexcept {
  return builder(std::move(message)).with_code(code).build(loc);
}

ErrorValue ErrorValue::from_native(std::string description,
                                   std::optional<std::error_code> code) noexcept {
  ErrorValue value(std::move(description));
  value.code_ = code;
  return value;
}

const ErrorValue& ErrorValue::root_cause() const noexcept {
  const ErrorValue* level = this;
  while (level->cause_) {
    level = level->cause_.get();
  }
  return *level;
}

std::size_t ErrorValue::depth() const noexcept {
  std::size_t n = 0;
  for (const ErrorValue* level = this; level != nullptr;
       level = level->cause()) {
    ++n;
  }
  return n;
}

bool ErrorValue::is(std::error_code ec) const noexcept {
  for (const ErrorValue* level = this; level != nullptr;
       level = level->cause()) {
    if (level->code_ && *level->code_ == ec) {
      return true;
    }
  }
  return false;
}

bool ErrorValue::is(std::errc ec) const noexcept {
  auto condition = std::make_error_condition(ec);
  for (const ErrorValue* level = this; level != nullptr;
       level = level->cause()) {
    if (level->code_ && *level->code_ == condition) {
      return true;
    }
  }
  return false;
}

std::string ErrorValue::render() const {
  std::string out;
  for (const ErrorValue* level = this; level != nullptr;
       level = level->cause()) {
    if (level != this) {
      out.append(CAUSE_SEPARATOR);
    }
    append_segment(out, *level);
  }
  return out;
}

std::string ErrorValue::render_verbose() const {
  std::string out;
  auto it = std::back_inserter(out);

  std::size_t nesting = 0;
  for (const ErrorValue* level = this; level != nullptr;
       level = level->cause(), ++nesting) {
    if (nesting == 0) {
      fmt::format_to(it, "{}", level->message());
    } else {
      fmt::format_to(it, "\n{} └─▶ caused by: {}",
                     std::string((nesting - 1) * 4, ' '), level->message());
    }

    // 最後一列明細在沒有下一層時以 └─ 收尾
    std::string indent(nesting * 4, ' ');
    auto details = details_of(*level);
    for (std::size_t i = 0; i < details.size(); ++i) {
      bool last = i + 1 == details.size() && level->cause() == nullptr;
      fmt::format_to(it, "\n{} {} {}", indent, last ? "└─" : "├─", details[i]);
    }
  }
  return out;
}

// ===========================
// ErrorBuilder
// ===========================

ErrorBuilder ErrorBuilder::with_context(std::string context) && noexcept {
  value_.context_ = std::move(context);
  return std::move(*this);
}

ErrorBuilder ErrorBuilder::with_status_code(std::uint32_t code) && noexcept {
  value_.status_code_ = code;
  return std::move(*this);
}

ErrorBuilder ErrorBuilder::with_status(std::string status) && noexcept {
  value_.status_ = std::move(status);
  return std::move(*this);
}

ErrorBuilder ErrorBuilder::with_code(std::error_code code) && noexcept {
  value_.code_ = code;
  return std::move(*this);
}

ErrorBuilder ErrorBuilder::with_source(ErrorValue source) && {
  value_.cause_ = std::make_unique<ErrorValue>(std::move(source));
  return std::move(*this);
}

ErrorBuilder ErrorBuilder::with_current_exception() && {
  std::exception_ptr current = std::current_exception();
  if (!current) {
    return std::move(*this);
  }

  try {
    std::rethrow_exception(current);
  } catch (const std::system_error& e) {
    return std::move(*this).with_source(e);
  } catch (const std::exception& e) {
    return std::move(*this).with_source(e);
  } catch (...) {
    // 非標準例外沒有可用的描述
    return std::move(*this).with_source(
        ErrorValue::from_native("unknown exception", std::nullopt));
  }
}

ErrorValue ErrorBuilder::build(std::source_location loc) && noexcept {
  value_.location_ = loc;
  return std::move(value_);
}

}  // namespace toolkit::errorsx
