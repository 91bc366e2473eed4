/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace rollkit {

  enum class HeaderError : uint8_t {
    MISSING_PROPOSER_ADDRESS = 1,
    PROPOSER_MISMATCH,
    PROPOSER_ADDRESS_TOO_LONG,
    CHAIN_ID_TOO_LONG,
  };

}

OUTCOME_HPP_DECLARE_ERROR(rollkit, HeaderError);
