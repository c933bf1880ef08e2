#pragma once

#include <spdlog/spdlog.h>

#include <chrono>

namespace tilegrid {

// Helper to time a function and log its duration at trace level
template <typename F>
auto timed(const char* name, F&& func) {
  auto start = std::chrono::steady_clock::now();
  auto result = func();
  auto end = std::chrono::steady_clock::now();
  spdlog::trace("{}: {}us", name,
                std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
  return result;
}

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace tilegrid
