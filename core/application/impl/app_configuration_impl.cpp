/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <charconv>
#include <iostream>

#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "crypto/bech32/bech32.hpp"
#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::application, AppConfigurationError, e) {
  using E = gorc::application::AppConfigurationError;
  switch (e) {
    case E::HELP_REQUESTED:
      return "help requested";
    case E::USAGE_ERROR:
      return "wrong command line usage";
    case E::INVALID_CONFIG_FILE:
      return "config file can't be read or is not valid JSON";
    case E::INVALID_VALUE:
      return "invalid configuration value";
  }
  return "unknown AppConfigurationError";
}

namespace {
  namespace po = boost::program_options;
  namespace pt = boost::property_tree;
  using gorc::application::AppConfigurationError;
  using gorc::application::KeysAction;

  template <typename T>
  std::optional<T> find_argument(po::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  bool find_argument(po::variables_map &vm, const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  template <typename T>
  std::optional<T> str_to_number(std::string_view str) {
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return std::nullopt;
    }
    return value;
  }

  std::optional<KeysAction> str_to_action(std::string_view str) {
    if (str == "add") {
      return KeysAction::Add;
    }
    if (str == "import") {
      return KeysAction::Import;
    }
    if (str == "delete") {
      return KeysAction::Delete;
    }
    if (str == "rename") {
      return KeysAction::Rename;
    }
    if (str == "list") {
      return KeysAction::List;
    }
    if (str == "show") {
      return KeysAction::Show;
    }
    return std::nullopt;
  }

  size_t names_count(KeysAction action) {
    switch (action) {
      case KeysAction::List:
        return 0;
      case KeysAction::Rename:
        return 2;
      case KeysAction::Add:
      case KeysAction::Import:
      case KeysAction::Delete:
      case KeysAction::Show:
        break;
    }
    return 1;
  }

  const std::string def_cosmos_prefix = "cosmos";
  const size_t def_mnemonic_words = 24;
}  // namespace

namespace gorc::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)), cosmos_prefix_(def_cosmos_prefix) {}

  outcome::result<void> AppConfigurationImpl::loadConfigFile(
      const filesystem::path &path) {
    pt::ptree tree;
    try {
      pt::read_json(path.native(), tree);
    } catch (const pt::json_parser_error &e) {
      SL_ERROR(logger_, "Config file {} is invalid: {}", path, e.what());
      return AppConfigurationError::INVALID_CONFIG_FILE;
    }
    OUTCOME_TRY(parseConfigTree(tree));
    return outcome::success();
  }

  outcome::result<void> AppConfigurationImpl::parseConfigTree(
      const pt::ptree &tree) {
    if (auto keystore = tree.get_optional<std::string>("keystore")) {
      keystore_path_ = keystore.value();
    }
    if (auto prefix = tree.get_optional<std::string>("cosmos.prefix")) {
      cosmos_prefix_ = prefix.value();
    }

    auto load_number = [&](const char *key, auto &target) -> bool {
      using T = std::decay_t<decltype(target)>;
      auto str = tree.get_optional<std::string>(key);
      if (not str) {
        return true;
      }
      auto value = str_to_number<T>(str.value());
      if (not value) {
        SL_ERROR(logger_, "Config file value {} is not a number", key);
        return false;
      }
      target = value.value();
      return true;
    };
    if (not load_number("kdf.scrypt_n", scrypt_params_.n)
        or not load_number("kdf.scrypt_r", scrypt_params_.r)
        or not load_number("kdf.scrypt_p", scrypt_params_.p)) {
      return AppConfigurationError::INVALID_VALUE;
    }
    return outcome::success();
  }

  outcome::result<void> AppConfigurationImpl::parseCommand(
      const std::vector<std::string> &positional) {
    if (positional.size() < 2) {
      std::cerr << "Error: chain and command are required\n" << kUsage;
      return AppConfigurationError::USAGE_ERROR;
    }
    auto chain = keystore::chainFromString(positional[0]);
    if (not chain) {
      std::cerr << "Error: unknown chain '" << positional[0]
                << "', expected cosmos or eth\n";
      return AppConfigurationError::USAGE_ERROR;
    }
    auto action = str_to_action(positional[1]);
    if (not action) {
      std::cerr << "Error: unknown command '" << positional[1] << "'\n"
                << kUsage;
      return AppConfigurationError::USAGE_ERROR;
    }
    if (positional.size() - 2 != names_count(*action)) {
      std::cerr << "Error: wrong number of arguments for '" << positional[1]
                << "'\n"
                << kUsage;
      return AppConfigurationError::USAGE_ERROR;
    }
    command_.chain = *chain;
    command_.action = *action;
    command_.names.assign(positional.begin() + 2, positional.end());
    return outcome::success();
  }

  bool AppConfigurationImpl::validateConfig() {
    if (keystore_path_.empty()) {
      SL_ERROR(logger_,
               "Keystore directory is required, "
               "set it with --keystore or in the config file");
      return false;
    }
    if (not crypto::bech32::encode(cosmos_prefix_, {})) {
      SL_ERROR(logger_,
               "Cosmos prefix '{}' is not a valid bech32 human readable part",
               cosmos_prefix_);
      return false;
    }
    if (not crypto::ScryptProviderImpl{}.validate(scrypt_params_)) {
      SL_ERROR(logger_,
               "Scrypt parameters N={} r={} p={} are invalid, N must be a "
               "power of two greater than one",
               scrypt_params_.n,
               scrypt_params_.r,
               scrypt_params_.p);
      return false;
    }
    return true;
  }

  outcome::result<void> AppConfigurationImpl::initializeFromArgs(
      int argc, const char **argv) {
    po::options_description desc("General options");
    // clang-format off
    desc.add_options()
        ("help,h", "show this help message")
        ("keystore,k", po::value<std::string>(), "required, keystore directory")
        ("cosmos-prefix", po::value<std::string>(), "bech32 prefix of Cosmos addresses (default: cosmos)")
        ("scrypt-n", po::value<uint64_t>(), "scrypt cost of new keys, power of two (default: 32768)")
        ("scrypt-r", po::value<uint32_t>(), "scrypt block size of new keys (default: 8)")
        ("scrypt-p", po::value<uint32_t>(), "scrypt parallelism of new keys (default: 1)")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax is `<target>=<level>`, e.g. -lkeystore=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off.\n"
          "By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to soralog yaml config file")
        ;

    po::options_description command_desc("Command options");
    command_desc.add_options()
        ("mnemonic", po::bool_switch(), "add: generate a mnemonic phrase to recover the key")
        ("words", po::value<size_t>()->default_value(def_mnemonic_words), "add: mnemonic length, 12, 15, 18, 21 or 24")
        ("account", po::value<uint32_t>(), "import: BIP-44 account index (default: 0)")
        ("hd-path", po::value<std::string>(), "import: explicit derivation path, e.g. m/44'/118'/0'/0/0")
        ("bip39-password", po::bool_switch(), "import: ask for the BIP-39 password of the mnemonic")
        ;

    po::options_description hidden_desc;
    hidden_desc.add_options()
        ("command-args", po::value<std::vector<std::string>>(), "chain, command and its operands")
        ;
    // clang-format on

    po::positional_options_description positional;
    positional.add("command-args", -1);

    po::options_description all_desc;
    all_desc.add(desc).add(command_desc).add(hidden_desc);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all_desc)
                    .positional(positional)
                    .run(),
                vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return AppConfigurationError::USAGE_ERROR;
    }

    if (vm.count("help") > 0) {
      std::cout << kUsage << '\n' << desc << '\n' << command_desc << std::endl;
      return AppConfigurationError::HELP_REQUESTED;
    }

    OUTCOME_TRY(parseCommand(
        find_argument<std::vector<std::string>>(vm, "command-args")
            .value_or(std::vector<std::string>{})));

    if (auto path = find_argument<std::string>(vm, "config-file")) {
      OUTCOME_TRY(loadConfigFile(*path));
    }

    // command line overrides config file
    if (auto keystore = find_argument<std::string>(vm, "keystore")) {
      keystore_path_ = *keystore;
    }
    if (auto prefix = find_argument<std::string>(vm, "cosmos-prefix")) {
      cosmos_prefix_ = *prefix;
    }
    if (auto n = find_argument<uint64_t>(vm, "scrypt-n")) {
      scrypt_params_.n = *n;
    }
    if (auto r = find_argument<uint32_t>(vm, "scrypt-r")) {
      scrypt_params_.r = *r;
    }
    if (auto p = find_argument<uint32_t>(vm, "scrypt-p")) {
      scrypt_params_.p = *p;
    }
    if (auto log = find_argument<std::vector<std::string>>(vm, "log")) {
      logger_tuning_config_ = std::move(*log);
    }

    const bool is_add = command_.action == KeysAction::Add;
    const bool is_import = command_.action == KeysAction::Import;
    command_.with_mnemonic = vm["mnemonic"].as<bool>();
    command_.words = vm["words"].as<size_t>();
    if ((command_.with_mnemonic or find_argument(vm, "words")) and not is_add) {
      std::cerr << "Error: --mnemonic and --words apply to add only\n";
      return AppConfigurationError::USAGE_ERROR;
    }
    if (find_argument(vm, "words") and not command_.with_mnemonic) {
      std::cerr << "Error: --words requires --mnemonic\n";
      return AppConfigurationError::USAGE_ERROR;
    }

    command_.account = find_argument<uint32_t>(vm, "account").value_or(0);
    command_.hd_path = find_argument<std::string>(vm, "hd-path");
    command_.ask_bip39_password = vm["bip39-password"].as<bool>();
    if ((find_argument(vm, "account") or command_.hd_path
         or command_.ask_bip39_password)
        and not is_import) {
      std::cerr << "Error: --account, --hd-path and --bip39-password apply "
                   "to import only\n";
      return AppConfigurationError::USAGE_ERROR;
    }
    if (find_argument(vm, "account") and command_.hd_path) {
      std::cerr << "Error: --account and --hd-path are mutually exclusive\n";
      return AppConfigurationError::USAGE_ERROR;
    }

    if (not validateConfig()) {
      return AppConfigurationError::INVALID_VALUE;
    }
    return outcome::success();
  }

}  // namespace gorc::application
