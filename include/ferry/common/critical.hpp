#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <utility>

namespace ferry::common {

/// Log at critical level, flush every registered logger and terminate.
///
/// Reserved for failures the process cannot recover from, such as an
/// unreadable database or a persisted row that no longer decodes.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
    logger->flush();
  });
  spdlog::shutdown();
  std::terminate();
}

}  // namespace ferry::common
