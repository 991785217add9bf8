/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/spdlog.h>

namespace rl::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Optional sink shared by all loggers, e.g. a log file
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Set level of all created loggers and of loggers created later
   * @param level - minimal level of messages to output
   */
  void setLogLevel(spdlog::level::level_enum level);
}  // namespace rl::common
