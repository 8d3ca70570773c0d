/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/provider_builder.hpp"

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/random/boost_random_source.hpp"
#include "crypto/random/openssl_random_source.hpp"
#include "ots/hasher_digest.hpp"
#include "ots/lamport_provider.hpp"

namespace lamport::app {

  namespace {
    std::shared_ptr<crypto::RandomSource> makeRandomSource(
        RandomSourceKind kind) {
      switch (kind) {
        case RandomSourceKind::OPENSSL:
          return std::make_shared<crypto::OpensslRandomSource>();
        case RandomSourceKind::BOOST:
          return std::make_shared<crypto::BoostRandomSource>();
      }
      return std::make_shared<crypto::OpensslRandomSource>();
    }
  }  // namespace

  std::shared_ptr<ots::OtsProvider> buildProvider(
      const SchemeConfig &config,
      qtils::SharedRef<log::LoggingSystem> logging_system) {
    logging_system->tuneLoggingSystem(config.logging);

    auto logger = logging_system->getLogger("ProviderBuilder",
                                            log::defaultGroupName);
    SL_DEBUG(logger,
             "Lamport provider with digest {}",
             ots::toString(config.digest));

    auto hasher = std::make_shared<crypto::HasherImpl>();
    auto digest = std::make_shared<ots::HasherDigest>(hasher, config.digest);
    return std::make_shared<ots::LamportProvider>(
        logging_system, digest, makeRandomSource(config.random_source));
  }

}  // namespace lamport::app
