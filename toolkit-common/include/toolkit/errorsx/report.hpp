#ifndef TOOLKIT_ERRORSX_REPORT_HPP
#define TOOLKIT_ERRORSX_REPORT_HPP

#include <fmt/format.h>

#include <cstdio>
#include <string>

#include "toolkit/errorsx/error.hpp"

namespace toolkit::errorsx {

/// @brief 將錯誤以多行格式輸出
/// @param error 要輸出的錯誤
/// @param out 輸出目標，預設為 stderr
/// @note errorsx 本身不會呼叫此函式，由最上層的呼叫端決定何時回報
void report(const ErrorValue& error, std::FILE* out = stderr);

}  // namespace toolkit::errorsx

/// @brief 支持 fmt，輸出與 render() 相同
template <>
struct fmt::formatter<toolkit::errorsx::ErrorValue>
    : fmt::formatter<std::string> {
  auto format(const toolkit::errorsx::ErrorValue& err,
              format_context& ctx) const {
    return fmt::formatter<std::string>::format(err.render(), ctx);
  }
};

#endif
