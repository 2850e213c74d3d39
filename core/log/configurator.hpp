/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace tessera::log {

  /**
   * Logging configurator with the embedded group tree of the node. A custom
   * YAML (string or file) may override it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::string config);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::filesystem::path path);

    /// Looks for `--logcfg <path>` among the arguments
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace tessera::log
