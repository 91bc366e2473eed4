/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/header_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollkit, HeaderError, e) {
  using E = rollkit::HeaderError;
  switch (e) {
    case E::MISSING_PROPOSER_ADDRESS:
      return "No proposer address";
    case E::PROPOSER_MISMATCH:
      return "Proposer of untrusted header doesn't match trusted one";
    case E::PROPOSER_ADDRESS_TOO_LONG:
      return "Proposer address is longer than allowed";
    case E::CHAIN_ID_TOO_LONG:
      return "Chain id is longer than allowed";
  }
  return "Unknown HeaderError";
}
