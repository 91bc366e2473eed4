/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_vec.hpp>

#include "tendermint/types/canonical.pb.h"
#include "tendermint/types/types.pb.h"

namespace rollkit {
  struct Header;
}  // namespace rollkit

namespace rollkit::consensus {

  using CometVote = ::tendermint::types::Vote;
  using CometBlockId = ::tendermint::types::BlockID;
  using CanonicalVote = ::tendermint::types::CanonicalVote;

  /**
   * Precommit vote of the sequencer for the header.
   * Sequencer is the only validator and votes once per height, so round and
   * validator index are always 0.
   */
  CometVote makePrecommitVote(const Header &header);

  bool isZero(const CometBlockId &block_id);

  /**
   * Canonical form of the vote, the one which is signed by CometBFT
   * validators. Zero block id (nil vote) is omitted.
   */
  CanonicalVote canonicalizeVote(std::string_view chain_id,
                                 const CometVote &vote);

  /**
   * Bytes to be signed for the vote: length-delimited protobuf encoding of
   * the canonical vote, same as CometBFT `VoteSignBytes`.
   */
  qtils::ByteVec voteSignBytes(std::string_view chain_id,
                               const CometVote &vote);

  /// Sign-bytes of the sequencer precommit vote for the header
  qtils::ByteVec makeCometBftVote(const Header &header);

}  // namespace rollkit::consensus
