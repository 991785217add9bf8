/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/common.h>

#include "config/config.hpp"
#include "ledger/reward_ledger.hpp"

namespace rl::config {
  using primitives::AccountId;
  using primitives::TimeDuration;

  /**
   * Settings of a reward ledger instance. JSON layout:
   * {
   *   "ledger": {
   *     "account": "100",
   *     "admin": "1",
   *     "rewards_duration": "604800"
   *   },
   *   "log": {"level": "info", "file": "/var/log/reward_ledger.log"}
   * }
   * `ledger.account` and `ledger.admin` are required, account ids must not be
   * negative.
   */
  struct LedgerConfig {
    AccountId ledger_account{};
    AccountId admin{};
    TimeDuration rewards_duration{};
    spdlog::level::level_enum log_level{spdlog::level::info};
    /// loggers created afterwards also write to this file
    boost::optional<std::string> log_file;
  };

  outcome::result<LedgerConfig> readLedgerConfig(const Config &config);

  outcome::result<LedgerConfig> loadLedgerConfig(const std::string &filename);

  outcome::result<void> saveLedgerConfig(const LedgerConfig &ledger_config,
                                         const std::string &filename);

  /**
   * Sets log level of all loggers to the configured one and opens the
   * configured log file as common::file_sink
   */
  void applyLogging(const LedgerConfig &ledger_config);

  /**
   * Creates ledger administered by the configured admin
   */
  std::shared_ptr<ledger::RewardLedger> makeRewardLedger(
      const LedgerConfig &ledger_config,
      asset::FungibleAssetPtr staking_asset,
      asset::FungibleAssetPtr rewards_asset,
      std::shared_ptr<clock::UTCClock> clock);
}  // namespace rl::config
