/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/ledger_config.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include "auth/impl/single_admin_authorizer.hpp"
#include "common/logger.hpp"

namespace rl::config {
  namespace {
    constexpr auto kAccount{"ledger.account"};
    constexpr auto kAdmin{"ledger.admin"};
    constexpr auto kRewardsDuration{"ledger.rewards_duration"};
    constexpr auto kLogLevel{"log.level"};
    constexpr auto kLogFile{"log.file"};

    /// Account ids are read signed, so that "-1" is not wrapped around
    outcome::result<AccountId> getAccountId(const Config &config,
                                            const ConfigKey &key) {
      OUTCOME_TRY(id, config.get<int64_t>(key));
      if (id < 0) {
        return ConfigError::kInvalidValue;
      }
      return static_cast<AccountId>(id);
    }
  }  // namespace

  outcome::result<LedgerConfig> readLedgerConfig(const Config &config) {
    LedgerConfig ledger_config;
    OUTCOME_TRYA(ledger_config.ledger_account, getAccountId(config, kAccount));
    OUTCOME_TRYA(ledger_config.admin, getAccountId(config, kAdmin));

    OUTCOME_TRY(duration, config.tryGet<TimeDuration>(kRewardsDuration));
    if (duration) {
      if (*duration < 0) {
        return ConfigError::kInvalidValue;
      }
      ledger_config.rewards_duration = *duration;
    }

    OUTCOME_TRY(level, config.tryGet<std::string>(kLogLevel));
    if (level) {
      ledger_config.log_level = spdlog::level::from_str(*level);
      if (ledger_config.log_level == spdlog::level::off && *level != "off") {
        return ConfigError::kInvalidValue;
      }
    }

    OUTCOME_TRYA(ledger_config.log_file, config.tryGet<std::string>(kLogFile));
    return ledger_config;
  }

  outcome::result<LedgerConfig> loadLedgerConfig(const std::string &filename) {
    Config config;
    OUTCOME_TRY(config.load(filename));
    return readLedgerConfig(config);
  }

  outcome::result<void> saveLedgerConfig(const LedgerConfig &ledger_config,
                                         const std::string &filename) {
    Config config;
    config.set(kAccount, ledger_config.ledger_account);
    config.set(kAdmin, ledger_config.admin);
    config.set(kRewardsDuration, ledger_config.rewards_duration);
    const auto level{spdlog::level::to_string_view(ledger_config.log_level)};
    config.set(kLogLevel, std::string{level.data(), level.size()});
    if (ledger_config.log_file) {
      config.set(kLogFile, *ledger_config.log_file);
    }
    return config.save(filename);
  }

  void applyLogging(const LedgerConfig &ledger_config) {
    common::setLogLevel(ledger_config.log_level);
    if (ledger_config.log_file) {
      common::file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          *ledger_config.log_file);
      spdlog::default_logger()->sinks().push_back(common::file_sink);
    }
  }

  std::shared_ptr<ledger::RewardLedger> makeRewardLedger(
      const LedgerConfig &ledger_config,
      asset::FungibleAssetPtr staking_asset,
      asset::FungibleAssetPtr rewards_asset,
      std::shared_ptr<clock::UTCClock> clock) {
    return std::make_shared<ledger::RewardLedger>(
        ledger_config.ledger_account,
        std::move(staking_asset),
        std::move(rewards_asset),
        std::make_shared<auth::SingleAdminAuthorizer>(ledger_config.admin),
        std::move(clock),
        ledger_config.rewards_duration);
  }
}  // namespace rl::config
