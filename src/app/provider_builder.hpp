/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/scheme_config.hpp"
#include "log/logger.hpp"
#include "ots/ots_provider.hpp"

namespace lamport::app {

  /**
   * Applies the logging overrides of `config` and creates a Lamport provider
   * with the configured digest and random source.
   */
  std::shared_ptr<ots::OtsProvider> buildProvider(
      const SchemeConfig &config,
      qtils::SharedRef<log::LoggingSystem> logging_system);

}  // namespace lamport::app
