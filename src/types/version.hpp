/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <sszpp/container.hpp>

namespace rollkit {

  /// Block and app protocol versions
  struct Version : ssz::ssz_container {
    uint64_t block = 0;
    uint64_t app = 0;

    SSZ_CONT(block, app);
    bool operator==(const Version &) const = default;
  };

}  // namespace rollkit
