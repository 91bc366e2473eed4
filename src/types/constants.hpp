/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace rollkit {

  // Header list lengths

  /// Same bound as CometBFT `MaxChainIDLen`
  static constexpr uint64_t MAX_CHAIN_ID_LENGTH = 50;
  static constexpr uint64_t MAX_PROPOSER_ADDRESS_LENGTH = 64;

  // Header chain verification

  /// Maximum allowed height gap between trusted and candidate headers
  static constexpr uint64_t DEFAULT_HEIGHT_THRESHOLD = 80'000;
  /// Tolerated skew of candidate header time against local clock
  static constexpr std::chrono::milliseconds DEFAULT_CLOCK_DRIFT{10'000};

}  // namespace rollkit
