/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <limits>
#include <string_view>

#include <sszpp/container.hpp>

#include "types/types.hpp"

namespace rollkit {

  /**
   * @struct BaseHeader
   * The most basic data of a header: its place in the chain and the chain it
   * belongs to.
   */
  struct BaseHeader : ssz::ssz_variable_size_container {
    /// Block height (aka block number)
    Height height = 0;
    /// Unix time of the block in nanoseconds
    TimestampNs time = 0;
    /// Identifier of the rollup chain
    ChainId chain_id;

    SSZ_CONT(height, time, chain_id);
    bool operator==(const BaseHeader &) const = default;

    std::string_view chainIdView() const {
      const auto &bytes = chain_id.data();
      return {
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<const char *>(bytes.data()),
          bytes.size(),
      };
    }

    /**
     * Time as a point since Unix epoch.
     * Values beyond signed 64-bit nanoseconds are saturated.
     */
    Timestamp timestamp() const {
      constexpr auto kMaxTime =
          static_cast<TimestampNs>(std::numeric_limits<int64_t>::max());
      return Timestamp{std::chrono::nanoseconds{
          static_cast<int64_t>(std::min(time, kMaxTime)),
      }};
    }
  };

}  // namespace rollkit
