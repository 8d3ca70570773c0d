/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "utils/ctor_limiters.hpp"

namespace lamport::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_LOGGER };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"lamport"};

  /// Group of loggers used by key generation, signing and verification
  inline static std::string otsGroupName{"ots"};

  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    LoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

    /**
     * Applies level overrides.
     * Each entry is either a bare level, applied to the default group,
     * or `group=level`.
     */
    void tuneLoggingSystem(const std::vector<std::string> &cfg);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    [[nodiscard]] bool resetLevelOfGroup(const std::string &group_name) const {
      return logging_system_->resetLevelOfGroup(group_name);
    }

    auto &getSoralog() const {
      return logging_system_;
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace lamport::log

OUTCOME_HPP_DECLARE_ERROR(lamport::log, Error);
