/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/comet_vote.hpp"

#include <google/protobuf/io/coded_stream.h>

#include "types/header.hpp"

namespace rollkit::consensus {

  constexpr int64_t kNanosPerSecond = 1'000'000'000;

  CometVote makePrecommitVote(const Header &header) {
    CometVote vote;
    vote.set_type(::tendermint::types::SIGNED_MSG_TYPE_PRECOMMIT);
    vote.set_height(static_cast<int64_t>(header.height()));
    vote.set_round(0);

    // header hash is the block hash
    auto hash = header.hash();
    auto *block_id = vote.mutable_block_id();
    block_id->set_hash(hash.data(), hash.size());
    block_id->mutable_part_set_header();

    auto nanos = header.time().time_since_epoch().count();
    auto *timestamp = vote.mutable_timestamp();
    timestamp->set_seconds(nanos / kNanosPerSecond);
    timestamp->set_nanos(static_cast<int32_t>(nanos % kNanosPerSecond));

    // sequencer is the validator
    const auto &address = header.proposer_address.data();
    vote.set_validator_address(address.data(), address.size());
    vote.set_validator_index(0);
    return vote;
  }

  bool isZero(const CometBlockId &block_id) {
    return block_id.hash().empty() and block_id.part_set_header().total() == 0
       and block_id.part_set_header().hash().empty();
  }

  CanonicalVote canonicalizeVote(std::string_view chain_id,
                                 const CometVote &vote) {
    CanonicalVote canonical;
    canonical.set_type(vote.type());
    canonical.set_height(vote.height());
    canonical.set_round(vote.round());
    if (not isZero(vote.block_id())) {
      auto *block_id = canonical.mutable_block_id();
      block_id->set_hash(vote.block_id().hash());
      auto *part_set_header = block_id->mutable_part_set_header();
      part_set_header->set_total(vote.block_id().part_set_header().total());
      part_set_header->set_hash(vote.block_id().part_set_header().hash());
    }
    // timestamp is not nullable in canonical vote
    *canonical.mutable_timestamp() = vote.timestamp();
    canonical.set_chain_id(chain_id.data(), chain_id.size());
    return canonical;
  }

  qtils::ByteVec voteSignBytes(std::string_view chain_id,
                               const CometVote &vote) {
    using google::protobuf::io::CodedOutputStream;

    auto canonical = canonicalizeVote(chain_id, vote);
    const auto size = canonical.ByteSizeLong();

    qtils::ByteVec out(CodedOutputStream::VarintSize64(size) + size);
    auto *target = CodedOutputStream::WriteVarint64ToArray(size, out.data());
    canonical.SerializeWithCachedSizesToArray(target);
    return out;
  }

  qtils::ByteVec makeCometBftVote(const Header &header) {
    return voteSignBytes(header.chainId(), makePrecommitVote(header));
  }

}  // namespace rollkit::consensus
