/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rl::common {
  namespace {
    constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S.%e][%^%l%$] %n: %v"};
  }  // namespace

  spdlog::sink_ptr file_sink;

  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    auto logger{spdlog::stdout_color_mt(tag)};
    if (file_sink) {
      logger->sinks().push_back(file_sink);
    }
    logger->set_pattern(kPattern);
    return logger;
  }

  void setLogLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
  }
}  // namespace rl::common
