/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "common/outcome.hpp"
#include "config/config_error.hpp"

namespace rl::config {

  /** @brief Configuration key, dot separated path */
  using ConfigKey = std::string;

  /**
   * @brief JSON configuration file
   */
  class Config {
   public:
    /**
     * @brief Save config to file
     * @param filename - path to a file to store config
     * @return nothing or error occurred
     */
    outcome::result<void> save(const std::string &filename) const;

    /**
     * @brief Load config from file
     * @param filename - path to a file with config
     * @return nothing or error occurred
     */
    outcome::result<void> load(const std::string &filename);

    template <typename T>
    void set(const ConfigKey &key, const T &value) {
      ptree_.put<T>(key, value);
    }

    /**
     * Get config value by key
     * @tparam T - expected type of a configuration value
     * @param key - configuration key
     * @return value, kBadPath if key is missing or kInvalidValue if value
     * cannot be converted to T
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key) const {
      try {
        return ptree_.get<T>(key);
      } catch (const boost::property_tree::ptree_bad_path &) {
        return ConfigError::kBadPath;
      } catch (const boost::property_tree::ptree_bad_data &) {
        return ConfigError::kInvalidValue;
      }
    }

    /// Like get, but missing key gives none instead of error
    template <typename T>
    outcome::result<boost::optional<T>> tryGet(const ConfigKey &key) const {
      if (!ptree_.get_child_optional(key)) {
        return boost::none;
      }
      OUTCOME_TRY(value, get<T>(key));
      return boost::make_optional(std::move(value));
    }

   private:
    boost::property_tree::ptree ptree_;
  };

}  // namespace rl::config
