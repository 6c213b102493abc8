/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include <boost/program_options.hpp>

#include "application/slashtags_config.hpp"
#include "common/hexutil.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "key/key.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace {
  void usage(const char *argv0,
             const boost::program_options::options_description &desc) {
    std::cerr << "Usage: " << argv0 << " [--primary-key <hex>] [--name <name>]"
              << "\nPrints the slashtag URL to stderr and the secret key to "
                 "stdout.\n"
              << desc << std::endl;
  }
}  // namespace

int main(int argc, const char **argv) {
  namespace po = boost::program_options;

  // clang-format off
  po::options_description desc("Key options");
  desc.add_options()
      ("help,h", "show this help message")
      ("primary-key,p", po::value<std::string>(), "hex encoded primary key the key pair is derived from, random if missing")
      ("name,n", po::value<std::string>()->default_value(""), "name of the key pair under the primary key")
      ("config,c", po::value<std::string>(), "JSON configuration file, its `general.log` entries tune logging")
      ("log,l", po::value<std::vector<std::string>>(), "logging filter, `<level>` or `<group>=<level>`")
      ;
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << '\n';
    usage(argv[0], desc);
    return EXIT_FAILURE;
  }
  if (vm.count("help") > 0) {
    usage(argv[0], desc);
    return EXIT_SUCCESS;
  }

  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<slashtags::log::Configurator>(
          std::make_shared<soralog::ConfiguratorFromYAML>(std::string(R"(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: warning
  )"))));
  auto config_result = logging_system->configure();
  if (config_result.has_error) {
    std::cerr << config_result.message << std::endl;
    return EXIT_FAILURE;
  }
  slashtags::log::setLoggingSystem(logging_system);
  if (vm.count("config") > 0) {
    slashtags::application::SlashtagsConfig config;
    auto load_res = config.loadFromFile(vm["config"].as<std::string>());
    if (load_res.has_error()) {
      std::cerr << "Invalid configuration: " << load_res.error().message()
                << std::endl;
      return EXIT_FAILURE;
    }
    slashtags::log::tuneLoggingSystem(config.log());
  }
  if (vm.count("log") > 0) {
    slashtags::log::tuneLoggingSystem(vm["log"].as<std::vector<std::string>>());
  }

  std::optional<slashtags::common::Buffer> primary_key;
  if (vm.count("primary-key") > 0) {
    auto primary_res =
        slashtags::common::unhex(vm["primary-key"].as<std::string>());
    if (primary_res.has_error()) {
      std::cerr << "Invalid primary key: " << primary_res.error().message()
                << std::endl;
      return EXIT_FAILURE;
    }
    primary_key = std::move(primary_res.value());
  }

  slashtags::key::Key key{
      std::make_shared<slashtags::crypto::Ed25519ProviderImpl>()};
  auto res = key.run(primary_key, vm["name"].as<std::string>());
  if (res.has_error()) {
    std::cerr << "Key generation failed: " << res.error().message()
              << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
