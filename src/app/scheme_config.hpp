/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "ots/digest.hpp"

namespace lamport::app {

  enum class RandomSourceKind : uint8_t {
    OPENSSL,
    BOOST,
  };

  /**
   * Selection of digest and random source for a provider.
   *
   * ```yaml
   * digest: sha2-256
   * random_source: openssl
   * logging:
   *   - debug
   *   - ots=trace
   * ```
   */
  struct SchemeConfig {
    ots::DigestAlgorithm digest = ots::DigestAlgorithm::SHA2_256;
    RandomSourceKind random_source = RandomSourceKind::OPENSSL;
    /// Entries for `log::LoggingSystem::tuneLoggingSystem`
    std::vector<std::string> logging;
  };

  enum class SchemeConfigError : uint8_t {
    INVALID = 1,
    UNKNOWN_RANDOM_SOURCE,
  };

  outcome::result<SchemeConfig> readSchemeConfig(const YAML::Node &yaml);

  /**
   * Read scheme config from yaml file
   */
  outcome::result<SchemeConfig> readSchemeConfigYaml(
      const std::filesystem::path &path);

}  // namespace lamport::app

OUTCOME_HPP_DECLARE_ERROR(lamport::app, SchemeConfigError);
