/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/scheme_config.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lamport::app, SchemeConfigError, e) {
  using E = lamport::app::SchemeConfigError;
  switch (e) {
    case E::INVALID:
      return "Invalid scheme config";
    case E::UNKNOWN_RANDOM_SOURCE:
      return "Unknown random source";
  }
  return "Unknown SchemeConfigError";
}

namespace lamport::app {

  namespace {
    outcome::result<RandomSourceKind> randomSourceFromString(
        std::string_view name) {
      if (name == "openssl") {
        return RandomSourceKind::OPENSSL;
      }
      if (name == "boost") {
        return RandomSourceKind::BOOST;
      }
      return SchemeConfigError::UNKNOWN_RANDOM_SOURCE;
    }
  }  // namespace

  outcome::result<SchemeConfig> readSchemeConfig(const YAML::Node &yaml) {
    if (not yaml.IsMap()) {
      return SchemeConfigError::INVALID;
    }
    SchemeConfig config;

    if (auto yaml_digest = yaml["digest"]) {
      if (not yaml_digest.IsScalar()) {
        return SchemeConfigError::INVALID;
      }
      BOOST_OUTCOME_TRY(
          config.digest,
          ots::digestAlgorithmFromString(yaml_digest.as<std::string>()));
    }

    if (auto yaml_random = yaml["random_source"]) {
      if (not yaml_random.IsScalar()) {
        return SchemeConfigError::INVALID;
      }
      BOOST_OUTCOME_TRY(config.random_source,
                        randomSourceFromString(yaml_random.as<std::string>()));
    }

    if (auto yaml_logging = yaml["logging"]) {
      if (not yaml_logging.IsSequence()) {
        return SchemeConfigError::INVALID;
      }
      for (auto &&yaml_entry : yaml_logging) {
        if (not yaml_entry.IsScalar()) {
          return SchemeConfigError::INVALID;
        }
        config.logging.emplace_back(yaml_entry.as<std::string>());
      }
    }

    return config;
  }

  outcome::result<SchemeConfig> readSchemeConfigYaml(
      const std::filesystem::path &path) {
    return readSchemeConfig(YAML::LoadFile(path.string()));
  }

}  // namespace lamport::app
