/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cinttypes>
#include <string_view>

#include <qtils/bytes.hpp>
#include <sszpp/ssz++.hpp>

#include "types/constants.hpp"
#include "types/hash.hpp"

namespace rollkit {
  // header types

  using Height = uint64_t;

  /// Unix time in nanoseconds, as stored in the header
  using TimestampNs = uint64_t;

  /// Unix time with nanosecond precision, as exposed by the header
  using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

  using HeaderHash = Hash;
  using CommitHash = Hash;
  using DataHash = Hash;
  using ConsensusHash = Hash;
  using AppHash = Hash;
  using ValidatorHash = Hash;
  using ResultsHash = Hash;

  using ChainId = ssz::list<uint8_t, MAX_CHAIN_ID_LENGTH>;
  using ProposerAddress = ssz::list<uint8_t, MAX_PROPOSER_ADDRESS_LENGTH>;

  inline ChainId makeChainId(std::string_view str) {
    ChainId chain_id;
    chain_id.data().assign(str.begin(), str.end());
    return chain_id;
  }

  inline ProposerAddress makeProposerAddress(qtils::BytesIn bytes) {
    ProposerAddress address;
    address.data().assign(bytes.begin(), bytes.end());
    return address;
  }
}  // namespace rollkit
