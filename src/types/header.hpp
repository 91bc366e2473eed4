/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "log/formatters/header_index_ref.hpp"
#include "serde/serialization.hpp"
#include "sync/verifiable_header.hpp"
#include "sync/verify_error.hpp"
#include "types/base_header.hpp"
#include "types/header_error.hpp"
#include "types/types.hpp"
#include "types/version.hpp"

namespace rollkit {

  /**
   * @struct Header
   * Rollup block header. Commits to the content of the block, links it to the
   * previous one and names the sequencer which produced it.
   */
  struct Header : ssz::ssz_variable_size_container {
    BaseHeader base;
    /// Block and app version
    Version version;

    /// Hash of the previous header
    HeaderHash last_header_hash;

    /// Commit from aggregator(s) of the previous block
    CommitHash last_commit_hash;
    /// Root of the block data (transactions)
    DataHash data_hash;
    /// Consensus params of the current block
    ConsensusHash consensus_hash;
    /// State after applying transactions of the current block
    AppHash app_hash;
    /// Kept for compatibility with CometBFT light clients
    ValidatorHash validator_hash;
    /// Root of the results of transactions of the previous block
    ResultsHash last_results_hash;

    /// Address of the original proposer (sequencer) of the block
    ProposerAddress proposer_address;

    SSZ_CONT(base,
             version,
             last_header_hash,
             last_commit_hash,
             data_hash,
             consensus_hash,
             app_hash,
             validator_hash,
             last_results_hash,
             proposer_address);
    bool operator==(const Header &) const = default;

    static Header create() {
      return Header{};
    }

    static bool isZero(const std::optional<Header> &header) {
      return not header.has_value();
    }

    std::string_view chainId() const {
      return base.chainIdView();
    }

    Height height() const {
      return base.height;
    }

    Timestamp time() const {
      return base.timestamp();
    }

    const HeaderHash &lastHeader() const {
      return last_header_hash;
    }

    /// Hash tree root of all fields. Not cached, header is immutable.
    HeaderHash hash() const {
      return sszHash(*this);
    }

    outcome::result<void> validate() const {
      return validateBasic();
    }

    /**
     * Structural check of the header itself.
     * Proposer address must be present, proposer address and chain id must
     * fit their encoding limits.
     */
    outcome::result<void> validateBasic() const;

    /**
     * Checks `untrusted` header against this (trusted) one.
     * Proposer must be the same, nothing else is checked here.
     */
    sync::VerifyOutcome<void> verify(const Header &untrusted) const;

    outcome::result<qtils::ByteVec> marshalBinary() const;

    static outcome::result<Header> unmarshalBinary(qtils::BytesIn data);
  };

  static_assert(sync::VerifiableHeader<Header>);

}  // namespace rollkit

template <>
struct fmt::formatter<rollkit::Header>
    : fmt::formatter<rollkit::HeaderIndexRef> {
  template <typename FormatContext>
  auto format(const rollkit::Header &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<rollkit::HeaderIndexRef>::format(
        rollkit::HeaderIndexRef{v.height(), v.hash()}, ctx);
  }
};
