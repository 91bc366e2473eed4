/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace rollkit::app {

  const Configuration::SyncConfig &Configuration::sync() const {
    return sync_;
  }

  const std::vector<std::string> &Configuration::logLevels() const {
    return log_levels_;
  }

}  // namespace rollkit::app
