/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/serialization.hpp"

#include <gtest/gtest.h>

#include "testutil/make_header.hpp"
#include "types/header.hpp"

using rollkit::Header;
using testutil::makeHeader;
using testutil::repeatByte;

/**
 * @given header with every field set
 * @when it is marshalled and unmarshalled back
 * @then result equals to the original
 */
TEST(SerializationTest, HeaderRoundTrip) {
  auto header =
      makeHeader(1'000'000, 1'700'000'000'000'000'001, repeatByte(0xAB, 20));
  header.last_header_hash.fill(0x99);

  auto encoded = header.marshalBinary().value();
  auto decoded = Header::unmarshalBinary(encoded).value();
  EXPECT_EQ(decoded, header);
  EXPECT_EQ(decoded.hash(), header.hash());
  EXPECT_EQ(decoded.chainId(), "rollkit-test");
}

TEST(SerializationTest, ZeroHeaderRoundTrip) {
  auto header = Header::create();

  auto encoded = header.marshalBinary().value();
  auto decoded = Header::unmarshalBinary(encoded).value();
  EXPECT_EQ(decoded, header);
}

/**
 * @given bytes shorter than fixed part of a header
 * @when they are unmarshalled
 * @then decode error is returned
 */
TEST(SerializationTest, TruncatedInput) {
  auto header = makeHeader(1, 1, repeatByte(0xAB, 20));
  auto encoded = header.marshalBinary().value();

  qtils::ByteVec truncated(encoded.begin(), encoded.begin() + 3);
  auto res = Header::unmarshalBinary(truncated);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), make_error_code(rollkit::SszError::DecodeError));

  EXPECT_TRUE(Header::unmarshalBinary(qtils::ByteVec{}).has_error());
}

/**
 * @given valid header with proposer address and chain id of maximal length
 * @when it is marshalled and unmarshalled back
 * @then result equals to the original
 */
TEST(SerializationTest, LongestValidHeaderRoundTrip) {
  auto header = makeHeader(
      7, 7, repeatByte(0xAB, rollkit::MAX_PROPOSER_ADDRESS_LENGTH));
  header.base.chain_id =
      rollkit::makeChainId(std::string(rollkit::MAX_CHAIN_ID_LENGTH, 'c'));
  ASSERT_TRUE(header.validateBasic().has_value());

  auto encoded = header.marshalBinary().value();
  auto decoded = Header::unmarshalBinary(encoded).value();
  EXPECT_EQ(decoded, header);
}
