#include <benchmark/benchmark.h>

#include <string>
#include <system_error>
#include <utility>

#include "toolkit/errorsx/error.hpp"

namespace toolkit::errorsx::benchmark {

// =============================================================================
// 1. 建構：訊息較短時走 SSO，不應有額外分配
// =============================================================================

static void BM_ErrorValue_From(::benchmark::State& state) {
  for (auto _ : state) {
    auto err = ErrorValue::from("short");
    ::benchmark::DoNotOptimize(err);
  }
}
BENCHMARK(BM_ErrorValue_From);

static void BM_ErrorValue_AllFields(::benchmark::State& state) {
  for (auto _ : state) {
    auto err = ErrorValue::builder("parse failed")
                   .with_context("reading config")
                   .with_status_code(400)
                   .with_status("Bad Request")
                   .build();
    ::benchmark::DoNotOptimize(err);
  }
}
BENCHMARK(BM_ErrorValue_AllFields);

// =============================================================================
// 2. cause chain：每一層一次 unique_ptr 分配
// =============================================================================

static void BM_ErrorValue_ThreeLevelChain(::benchmark::State& state) {
  for (auto _ : state) {
    auto e1 = ErrorValue::from("a");
    auto e2 = ErrorValue::builder("b").with_source(std::move(e1)).build();
    auto e3 = ErrorValue::builder("c").with_source(std::move(e2)).build();
    ::benchmark::DoNotOptimize(e3);
  }
}
BENCHMARK(BM_ErrorValue_ThreeLevelChain);

static void BM_ErrorValue_NativeSource(::benchmark::State& state) {
  std::system_error io(std::make_error_code(std::errc::io_error), "read");
  for (auto _ : state) {
    auto err = ErrorValue::builder("load failed").with_source(io).build();
    ::benchmark::DoNotOptimize(err);
  }
}
BENCHMARK(BM_ErrorValue_NativeSource);

// =============================================================================
// 3. 輸出
// =============================================================================

static void BM_ErrorValue_Render(::benchmark::State& state) {
  auto err = ErrorValue::builder("failed to load listen port")
                 .with_context("reading server config")
                 .with_status_code(400)
                 .with_status("Bad Request")
                 .with_source(ErrorValue::from_code(
                     std::make_error_code(std::errc::invalid_argument),
                     "invalid port 'http'"))
                 .build();

  for (auto _ : state) {
    std::string s = err.render();
    ::benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_ErrorValue_Render);

}  // namespace toolkit::errorsx::benchmark
