/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "types/constants.hpp"

namespace rollkit::app {
  class Configuration {
   public:
    struct SyncConfig {
      /// 0 means DEFAULT_HEIGHT_THRESHOLD
      uint64_t height_threshold = DEFAULT_HEIGHT_THRESHOLD;
      std::chrono::milliseconds clock_drift = DEFAULT_CLOCK_DRIFT;
      /// Check that adjacent header refers to the hash of trusted one
      bool check_hash_linkage = true;
    };

    Configuration() = default;
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const SyncConfig &sync() const;

    /// Level overrides, `<level>` or `<group>=<level>`
    [[nodiscard]] virtual const std::vector<std::string> &logLevels() const;

   private:
    friend class Configurator;  // for external configure

    SyncConfig sync_;
    std::vector<std::string> log_levels_;
  };

}  // namespace rollkit::app
