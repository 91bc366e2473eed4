/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/verify_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollkit::sync, VerifyError, e) {
  using E = rollkit::sync::VerifyError;
  switch (e) {
    case E::ZERO_HEADER:
      return "Zero header";
    case E::WRONG_CHAIN_ID:
      return "Wrong chain id";
    case E::UNORDERED_TIME:
      return "Unordered headers";
    case E::FROM_FUTURE:
      return "Header is from the future";
    case E::KNOWN_HEADER:
      return "Known header";
    case E::HEIGHT_FROM_FUTURE:
      return "Header height is far from future";
    case E::LAST_HEADER_HASH_MISMATCH:
      return "Last header hash doesn't match hash of trusted header";
  }
  return "Unknown VerifyError";
}
