#include "toolkit/errorsx/report.hpp"

#include <fmt/format.h>

namespace toolkit::errorsx {

void report(const ErrorValue& error, std::FILE* out) {
  fmt::print(out, "{}\n", error.render_verbose());
}

}  // namespace toolkit::errorsx
