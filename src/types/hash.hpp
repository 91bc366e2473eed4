/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace rollkit {
  using Hash = qtils::ByteArr<32>;

  constexpr Hash kZeroHash;
}  // namespace rollkit
