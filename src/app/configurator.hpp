/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

namespace soralog {
  class Logger;
}  // namespace soralog

namespace rollkit::log {
  class LoggingSystem;
}  // namespace rollkit::log

namespace rollkit::app {
  class Configuration;
}  // namespace rollkit::app

namespace rollkit::app {

  /**
   * Builds `Configuration` from a yaml document.
   * Absent document or section leaves default values.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      ConfigFileParseFailed = 1,
      InvalidValue,
    };

    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    explicit Configurator(std::optional<YAML::Node> config_file = std::nullopt);

    outcome::result<void> loadConfigFile(const std::filesystem::path &path);

    outcome::result<YAML::Node> getLoggingConfig();

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initSyncConfig();
    outcome::result<void> initLoggingLevels();
    outcome::result<void> reportFileErrors();

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<std::filesystem::path> config_path_;
    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
  };

  /// Applies level overrides of `log` section to the logging system
  outcome::result<void> applyLoggingLevels(const Configuration &config,
                                           log::LoggingSystem &logging_system);

}  // namespace rollkit::app

OUTCOME_HPP_DECLARE_ERROR(rollkit::app, Configurator::Error);
