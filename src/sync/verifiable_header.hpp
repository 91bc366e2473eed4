/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <optional>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "sync/verify_error.hpp"
#include "types/types.hpp"

namespace rollkit::sync {

  /**
   * Operations a header type has to provide to be synchronized and verified
   * by a generic header chain machinery (see `HeaderVerifier`).
   *
   * - `create()` makes a fresh zero value;
   * - `isZero(opt)` tells whether a header is absent;
   * - `verify(untrusted)` is called on a trusted header and checks an
   *   untrusted one by type specific rules;
   * - `marshalBinary()`/`unmarshalBinary()` is a round-trip codec.
   */
  template <typename H>
  concept VerifiableHeader =
      std::default_initializable<H> and std::equality_comparable<H>
      and requires(const H &header,
                   const std::optional<H> &maybe_header,
                   qtils::BytesIn bytes) {
            { H::create() } -> std::same_as<H>;
            { H::isZero(maybe_header) } -> std::same_as<bool>;
            { header.chainId() } -> std::convertible_to<std::string_view>;
            { header.height() } -> std::same_as<Height>;
            { header.time() } -> std::same_as<Timestamp>;
            { header.lastHeader() } -> std::convertible_to<const HeaderHash &>;
            { header.hash() } -> std::same_as<HeaderHash>;
            { header.validate() } -> std::same_as<outcome::result<void>>;
            { header.verify(header) } -> std::same_as<VerifyOutcome<void>>;
            {
              header.marshalBinary()
            } -> std::same_as<outcome::result<qtils::ByteVec>>;
            { H::unmarshalBinary(bytes) } -> std::same_as<outcome::result<H>>;
          };

}  // namespace rollkit::sync
