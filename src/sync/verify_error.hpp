/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>

#include <qtils/enum_error_code.hpp>

#include "outcome/custom.hpp"

namespace rollkit::sync {

  /// General checks made on any pair of trusted and untrusted headers
  enum class VerifyError : uint8_t {
    ZERO_HEADER = 1,
    WRONG_CHAIN_ID,
    UNORDERED_TIME,
    FROM_FUTURE,
    KNOWN_HEADER,
    HEIGHT_FROM_FUTURE,
    LAST_HEADER_HASH_MISMATCH,
  };

}  // namespace rollkit::sync

OUTCOME_HPP_DECLARE_ERROR(rollkit::sync, VerifyError);

namespace rollkit::sync {

  /**
   * Reason of rejecting an untrusted header.
   * `code` is the kind of the failure, `reason` is a human readable detail.
   */
  struct HeaderVerifyError {
    [[nodiscard]] const std::string &message() const {
      return reason;
    }

    static HeaderVerifyError from(std::error_code ec) {
      return HeaderVerifyError{.code = ec, .reason = ec.message()};
    }

    std::error_code code;
    std::string reason;
    /// Set when the header can't be blamed for sure (non-adjacent headers)
    bool soft_failure = false;
  };

  inline std::error_code make_error_code(const HeaderVerifyError &e) {
    return e.code;
  }

  inline void outcome_throw_as_system_error_with_payload(HeaderVerifyError e) {
    throw std::system_error(e.code, e.reason);
  }

  template <typename T>
  using VerifyOutcome = CustomOutcome<T, HeaderVerifyError>;

}  // namespace rollkit::sync
