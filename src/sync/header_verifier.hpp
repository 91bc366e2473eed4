/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>

#include <fmt/format.h>
#include <qtils/shared_ref.hpp>
#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "sync/verifiable_header.hpp"
#include "sync/verify_error.hpp"

namespace rollkit::sync {

  /**
   * Decides whether an untrusted header may extend a trusted one.
   *
   * General rules are applied to any header type: the candidate must be
   * present, of the same chain, strictly newer in time and height, not ahead
   * of the local clock more than the allowed drift and not too far in
   * height. Then type specific validation and `trusted.verify(untrusted)`
   * run. Finally an adjacent candidate must refer to the hash of the trusted
   * header.
   */
  template <VerifiableHeader H>
  class HeaderVerifier {
   public:
    HeaderVerifier(qtils::SharedRef<log::LoggingSystem> logging_system,
                   qtils::SharedRef<clock::SystemClock> clock,
                   qtils::SharedRef<app::Configuration> config)
        : logger_{logging_system->getLogger("HeaderVerifier", "sync")},
          clock_{std::move(clock)},
          height_threshold_{config->sync().height_threshold == 0
                                ? DEFAULT_HEIGHT_THRESHOLD
                                : config->sync().height_threshold},
          clock_drift_{config->sync().clock_drift},
          check_hash_linkage_{config->sync().check_hash_linkage} {}

    VerifyOutcome<void> verify(const H &trusted,
                               const std::optional<H> &untrusted) const {
      auto res = verifyInternal(trusted, untrusted);
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "Header at height {} rejected ({}): {}",
                 H::isZero(untrusted) ? 0 : untrusted->height(),
                 res.error().soft_failure ? "soft" : "hard",
                 res.error().reason);
      } else {
        SL_TRACE(logger_,
                 "Header at height {} verified against {}",
                 untrusted->height(),
                 trusted.height());
      }
      return res;
    }

   private:
    static HeaderVerifyError fail(VerifyError error, std::string reason) {
      return HeaderVerifyError{
          .code = error,
          .reason = std::move(reason),
      };
    }

    VerifyOutcome<void> verifyInternal(
        const H &trusted, const std::optional<H> &maybe_untrusted) const {
      if (H::isZero(maybe_untrusted)) {
        return HeaderVerifyError::from(VerifyError::ZERO_HEADER);
      }
      const auto &untrusted = *maybe_untrusted;

      if (untrusted.chainId() != trusted.chainId()) {
        return fail(VerifyError::WRONG_CHAIN_ID,
                    fmt::format("expected chain id '{}' got '{}'",
                                trusted.chainId(),
                                untrusted.chainId()));
      }

      if (not(untrusted.time() > trusted.time())) {
        return fail(VerifyError::UNORDERED_TIME,
                    fmt::format("header time {}ns is not after trusted {}ns",
                                untrusted.time().time_since_epoch().count(),
                                trusted.time().time_since_epoch().count()));
      }

      auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(
          clock_->now());
      if (untrusted.time() > now + clock_drift_) {
        return fail(VerifyError::FROM_FUTURE,
                    fmt::format("header time {}ns is ahead of local time {}ns",
                                untrusted.time().time_since_epoch().count(),
                                now.time_since_epoch().count()));
      }

      if (untrusted.height() <= trusted.height()) {
        return fail(VerifyError::KNOWN_HEADER,
                    fmt::format("header height {} is not above trusted {}",
                                untrusted.height(),
                                trusted.height()));
      }

      if (untrusted.height() - trusted.height() > height_threshold_) {
        return fail(VerifyError::HEIGHT_FROM_FUTURE,
                    fmt::format("header height {} is too far from trusted {}",
                                untrusted.height(),
                                trusted.height()));
      }

      if (auto res = untrusted.validate(); res.has_error()) {
        return HeaderVerifyError::from(res.error());
      }

      const bool adjacent = untrusted.height() == trusted.height() + 1;

      if (auto res = trusted.verify(untrusted); res.has_error()) {
        auto error = std::move(res.error());
        // can't be sure the header is really wrong if it is not adjacent
        error.soft_failure = not adjacent;
        return error;
      }

      if (adjacent and check_hash_linkage_) {
        auto trusted_hash = trusted.hash();
        if (untrusted.lastHeader() != trusted_hash) {
          return fail(VerifyError::LAST_HEADER_HASH_MISMATCH,
                      fmt::format("expected last header {:0xx} got {:0xx}",
                                  trusted_hash,
                                  untrusted.lastHeader()));
        }
      }

      return outcome::success();
    }

    log::Logger logger_;
    qtils::SharedRef<clock::SystemClock> clock_;
    const uint64_t height_threshold_;
    const std::chrono::milliseconds clock_drift_;
    const bool check_hash_linkage_;
  };

}  // namespace rollkit::sync
