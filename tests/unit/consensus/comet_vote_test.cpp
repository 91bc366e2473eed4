/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/comet_vote.hpp"

#include <gtest/gtest.h>

#include "testutil/make_header.hpp"
#include "types/header.hpp"

using rollkit::consensus::CanonicalVote;
using rollkit::consensus::CometVote;
using rollkit::consensus::makeCometBftVote;
using rollkit::consensus::makePrecommitVote;
using rollkit::consensus::voteSignBytes;
using testutil::makeHeader;
using testutil::repeatByte;

namespace {
  std::string asString(const rollkit::HeaderHash &hash) {
    return {hash.begin(), hash.end()};
  }

  std::string asString(const std::vector<uint8_t> &bytes) {
    return {bytes.begin(), bytes.end()};
  }
}  // namespace

/**
 * @given precommit vote for height 5 with 0x01-filled block hash,
 * timestamp of 1s 500ns and chain "rollkit-test"
 * @when sign bytes are built
 * @then they match CometBFT length-delimited canonical vote encoding
 */
TEST(CometVoteTest, SignBytesMatchCometBft) {
  CometVote vote;
  vote.set_type(tendermint::types::SIGNED_MSG_TYPE_PRECOMMIT);
  vote.set_height(5);
  vote.set_round(0);
  vote.mutable_block_id()->set_hash(std::string(32, '\x01'));
  vote.mutable_block_id()->mutable_part_set_header();
  vote.mutable_timestamp()->set_seconds(1);
  vote.mutable_timestamp()->set_nanos(500);
  vote.set_validator_address(std::string(20, '\xAA'));
  vote.set_validator_index(0);

  // clang-format off
  std::vector<uint8_t> expected{
      0x46,                                            // length
      0x08, 0x02,                                      // type
      0x11, 0x05, 0x00, 0x00, 0x00,                    // height
            0x00, 0x00, 0x00, 0x00,
      0x22, 0x24,                                      // block id
      0x0a, 0x20,                                      //   hash
  };
  expected.insert(expected.end(), 32, 0x01);
  std::vector<uint8_t> tail{
      0x12, 0x00,                                      //   part set header
      0x2a, 0x05, 0x08, 0x01, 0x10, 0xf4, 0x03,        // timestamp
      0x32, 0x0c,                                      // chain id
      'r', 'o', 'l', 'l', 'k', 'i', 't', '-', 't', 'e', 's', 't',
  };
  // clang-format on
  expected.insert(expected.end(), tail.begin(), tail.end());

  auto bytes = voteSignBytes("rollkit-test", vote);
  EXPECT_EQ(std::vector<uint8_t>(bytes.begin(), bytes.end()), expected);
}

/**
 * @given vote without block id (nil vote)
 * @when sign bytes are built
 * @then block id is omitted, timestamp is still present
 */
TEST(CometVoteTest, NilVoteOmitsBlockId) {
  CometVote vote;
  vote.set_type(tendermint::types::SIGNED_MSG_TYPE_PRECOMMIT);
  vote.set_height(5);

  // clang-format off
  std::vector<uint8_t> expected{
      0x10,                                            // length
      0x08, 0x02,                                      // type
      0x11, 0x05, 0x00, 0x00, 0x00,                    // height
            0x00, 0x00, 0x00, 0x00,
      0x2a, 0x00,                                      // timestamp
      0x32, 0x01, 'c',                                 // chain id
  };
  // clang-format on

  auto bytes = voteSignBytes("c", vote);
  EXPECT_EQ(std::vector<uint8_t>(bytes.begin(), bytes.end()), expected);
}

/**
 * @given header
 * @when precommit vote is made for it
 * @then vote is signed by the proposer at round 0 with validator index 0 for
 * the block identified by the header hash
 */
TEST(CometVoteTest, PrecommitVoteOfHeader) {
  auto proposer = repeatByte(0xAA, 20);
  auto header = makeHeader(5, 1'700'000'000'123'456'789, proposer);

  auto vote = makePrecommitVote(header);
  EXPECT_EQ(vote.type(), tendermint::types::SIGNED_MSG_TYPE_PRECOMMIT);
  EXPECT_EQ(vote.height(), 5);
  EXPECT_EQ(vote.round(), 0);
  EXPECT_EQ(vote.validator_index(), 0);
  EXPECT_EQ(vote.validator_address(), asString(proposer));
  EXPECT_EQ(vote.block_id().hash(), asString(header.hash()));
  EXPECT_TRUE(vote.block_id().has_part_set_header());
  EXPECT_EQ(vote.block_id().part_set_header().total(), 0);
  EXPECT_TRUE(vote.block_id().part_set_header().hash().empty());
  EXPECT_EQ(vote.timestamp().seconds(), 1'700'000'000);
  EXPECT_EQ(vote.timestamp().nanos(), 123'456'789);
}

/**
 * @given header
 * @when CometBFT vote is made for it
 * @then result is length-delimited canonical vote of the header chain
 */
TEST(CometVoteTest, HeaderVoteIsCanonicalVote) {
  auto header = makeHeader(5, 2'000'000'007, repeatByte(0xAA, 20));

  auto bytes = makeCometBftVote(header);
  ASSERT_GT(bytes.size(), 1);
  ASSERT_LT(bytes[0], 0x80);
  ASSERT_EQ(bytes[0], bytes.size() - 1);

  CanonicalVote canonical;
  ASSERT_TRUE(canonical.ParseFromArray(bytes.data() + 1,
                                       static_cast<int>(bytes.size() - 1)));
  EXPECT_EQ(canonical.type(), tendermint::types::SIGNED_MSG_TYPE_PRECOMMIT);
  EXPECT_EQ(canonical.height(), 5);
  EXPECT_EQ(canonical.round(), 0);
  EXPECT_EQ(canonical.block_id().hash(), asString(header.hash()));
  EXPECT_EQ(canonical.timestamp().seconds(), 2);
  EXPECT_EQ(canonical.timestamp().nanos(), 7);
  EXPECT_EQ(canonical.chain_id(), "rollkit-test");

  EXPECT_EQ(bytes, voteSignBytes(header.chainId(), makePrecommitVote(header)));
}

/**
 * @given header
 * @then its vote is stable, and changes with height, proposer or content
 */
TEST(CometVoteTest, HeaderVoteIsDeterministic) {
  auto header = makeHeader(5, 1000, repeatByte(0xAA, 20));
  auto bytes = makeCometBftVote(header);
  EXPECT_EQ(bytes, makeCometBftVote(header));

  auto other_height = makeHeader(6, 1000, repeatByte(0xAA, 20));
  EXPECT_NE(bytes, makeCometBftVote(other_height));

  auto other_proposer = makeHeader(5, 1000, repeatByte(0xBB, 20));
  EXPECT_NE(bytes, makeCometBftVote(other_proposer));

  auto other_content = makeHeader(5, 1000, repeatByte(0xAA, 20));
  other_content.app_hash.fill(0x42);
  EXPECT_NE(bytes, makeCometBftVote(other_content));
}
