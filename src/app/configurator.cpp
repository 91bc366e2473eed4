/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <string>
#include <string_view>

#include <soralog/macro.hpp>

#include "app/configuration.hpp"
#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollkit::app, Configurator::Error, e) {
  using E = rollkit::app::Configurator::Error;
  switch (e) {
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown Configurator::Error";
}

namespace rollkit::app {

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: rollkit
        children:
          - name: config
          - name: consensus
          - name: sync
)yaml";

  Configurator::Configurator(std::optional<YAML::Node> config_file)
      : config_file_(std::move(config_file)) {
    config_ = std::make_shared<Configuration>();
  }

  outcome::result<void> Configurator::loadConfigFile(
      const std::filesystem::path &path) {
    try {
      config_file_ = YAML::LoadFile(path.string());
    } catch (const std::exception &) {
      return Error::ConfigFileParseFailed;
    }
    config_path_ = path;
    return outcome::success();
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initSyncConfig());
    OUTCOME_TRY(initLoggingLevels());
    OUTCOME_TRY(reportFileErrors());

    SL_DEBUG(logger_,
             "Sync config: height threshold {}, clock drift {}ms, "
             "hash linkage check {}",
             config_->sync_.height_threshold,
             config_->sync_.clock_drift.count(),
             config_->sync_.check_hash_linkage ? "on" : "off");
    return config_;
  }

  outcome::result<void> Configurator::initSyncConfig() {
    if (not config_file_.has_value()) {
      return outcome::success();
    }
    auto section = (*config_file_)["sync"];
    if (not section.IsDefined()) {
      return outcome::success();
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section 'sync' defined, but is not map\n";
      file_has_error_ = true;
      return outcome::success();
    }

    auto height_threshold = section["height-threshold"];
    if (height_threshold.IsDefined()) {
      if (height_threshold.IsScalar()) {
        try {
          config_->sync_.height_threshold = height_threshold.as<uint64_t>();
        } catch (const YAML::BadConversion &) {
          file_errors_ << "E: Value 'sync.height-threshold' must be "
                          "unsigned integer\n";
          file_has_error_ = true;
        }
      } else {
        file_errors_ << "E: Value 'sync.height-threshold' must be scalar\n";
        file_has_error_ = true;
      }
    }

    auto clock_drift = section["clock-drift-ms"];
    if (clock_drift.IsDefined()) {
      if (clock_drift.IsScalar()) {
        try {
          config_->sync_.clock_drift =
              std::chrono::milliseconds(clock_drift.as<uint64_t>());
        } catch (const YAML::BadConversion &) {
          file_errors_ << "E: Value 'sync.clock-drift-ms' must be "
                          "unsigned integer\n";
          file_has_error_ = true;
        }
      } else {
        file_errors_ << "E: Value 'sync.clock-drift-ms' must be scalar\n";
        file_has_error_ = true;
      }
    }

    auto check_hash_linkage = section["check-hash-linkage"];
    if (check_hash_linkage.IsDefined()) {
      if (check_hash_linkage.IsScalar()) {
        try {
          config_->sync_.check_hash_linkage = check_hash_linkage.as<bool>();
        } catch (const YAML::BadConversion &) {
          file_errors_ << "E: Value 'sync.check-hash-linkage' must be "
                          "boolean\n";
          file_has_error_ = true;
        }
      } else {
        file_errors_ << "E: Value 'sync.check-hash-linkage' must be scalar\n";
        file_has_error_ = true;
      }
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initLoggingLevels() {
    if (not config_file_.has_value()) {
      return outcome::success();
    }
    auto levels = (*config_file_)["log"];
    if (not levels.IsDefined()) {
      return outcome::success();
    }

    std::vector<std::string> values;
    if (levels.IsScalar()) {
      values.emplace_back(levels.as<std::string>());
    } else if (levels.IsSequence()) {
      for (const auto &item : levels) {
        if (not item.IsScalar()) {
          file_errors_ << "E: Items of 'log' must be scalar\n";
          file_has_error_ = true;
          return outcome::success();
        }
        values.emplace_back(item.as<std::string>());
      }
    } else {
      file_errors_ << "E: Value 'log' must be scalar or sequence\n";
      file_has_error_ = true;
      return outcome::success();
    }

    for (const auto &value : values) {
      auto level = std::string_view(value);
      if (auto pos = level.find('='); pos != std::string_view::npos) {
        level = level.substr(pos + 1);
      }
      if (not log::str2lvl(level).has_value()) {
        SL_ERROR(logger_, "Invalid log level in '{}'", value);
        return Error::InvalidValue;
      }
    }

    config_->log_levels_ = std::move(values);
    return outcome::success();
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_,
             "Config file `{}` has some problems:",
             config_path_.has_value() ? config_path_->string() : "<yaml>");
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> applyLoggingLevels(
      const Configuration &config, log::LoggingSystem &logging_system) {
    return logging_system.tuneLoggingSystem(config.logLevels());
  }

}  // namespace rollkit::app
