#pragma once

#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace h2mux {

// Throws std::system_error for the given errno value with a formatted context message.
template <typename... Args>
[[noreturn]] void ThrowSystemError(int err, std::format_string<Args...> fmt, Args&&... args) {
  throw std::system_error(std::error_code(err, std::generic_category()),
                          std::format(fmt, std::forward<Args>(args)...));
}

// Same as ThrowSystemError with the current errno value, captured before formatting.
// Usage: throw_errno("socketpair failed for family {}", family);
template <typename... Args>
[[noreturn]] void throw_errno(std::format_string<Args...> fmt, Args&&... args) {
  ThrowSystemError(errno, fmt, std::forward<Args>(args)...);
}

}  // namespace h2mux
