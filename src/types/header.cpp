/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/header.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rollkit {

  namespace {
    std::string toHex(const ProposerAddress &address) {
      return fmt::format("{:02X}", fmt::join(address.data(), ""));
    }
  }  // namespace

  outcome::result<void> Header::validateBasic() const {
    if (proposer_address.size() == 0) {
      return HeaderError::MISSING_PROPOSER_ADDRESS;
    }
    // over-limit lists can't be decoded back
    if (proposer_address.size() > MAX_PROPOSER_ADDRESS_LENGTH) {
      return HeaderError::PROPOSER_ADDRESS_TOO_LONG;
    }
    if (base.chain_id.size() > MAX_CHAIN_ID_LENGTH) {
      return HeaderError::CHAIN_ID_TOO_LONG;
    }
    return outcome::success();
  }

  sync::VerifyOutcome<void> Header::verify(const Header &untrusted) const {
    if (untrusted.proposer_address.data() != proposer_address.data()) {
      return sync::HeaderVerifyError{
          .code = HeaderError::PROPOSER_MISMATCH,
          .reason = fmt::format("expected proposer ({}) got ({})",
                                toHex(proposer_address),
                                toHex(untrusted.proposer_address)),
      };
    }
    return outcome::success();
  }

  outcome::result<qtils::ByteVec> Header::marshalBinary() const {
    return encode(*this);
  }

  outcome::result<Header> Header::unmarshalBinary(qtils::BytesIn data) {
    return decode<Header>(data);
  }

}  // namespace rollkit
