#include <CLI11.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "collector_config.hpp"
#include "hwid_application.hpp"
#include "hwid_types.hpp"

using namespace urhwid;

int main(int argc, char **argv) {
  CLI::App app{"ur-hwid-collect - Hardware ID collector for license requests"};

  bool verbose = false;
  std::string output_path;
  std::string config_path;
  std::string customer;
  std::string profile;
  std::string system_root;
  std::vector<std::string> features;

  app.add_flag("-v,--verbose", verbose, "Enable verbose output on stderr");
  app.add_option("-o,--out", output_path,
                 "Output filename (default: license_request-<hwid12>.json)");
  auto *features_opt =
      app.add_option("-f,--features", features,
                     "Requested features (default: " URHWID_DEFAULT_FEATURE ")")
          ->expected(0, CLI::detail::expected_max_vector_size);
  auto *customer_opt =
      app.add_option("-c,--customer", customer, "Customer label");
  auto *profile_opt =
      app.add_option("-p,--profile", profile, "Identity profile")
          ->check(CLI::IsMember(HwidTypeUtils::identity_profile_names()));
  auto *root_opt = app.add_option("--system-root", system_root,
                                  "Prefix applied to every system path");
  app.add_option("--config", config_path,
                 "Path to collector configuration JSON file");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  RunOptions options;
  options.verbose = verbose;
  options.output_path = output_path;

  if (!config_path.empty() &&
      !HwidApplication::load_config(config_path, options.config, verbose)) {
    return 1;
  }

  // Command line wins over the config file
  if (features_opt->count() > 0) {
    // A bare --features requests an empty list
    features.erase(std::remove(features.begin(), features.end(), std::string()),
                   features.end());
    options.config.features = features;
  }
  if (customer_opt->count() > 0) {
    options.config.customer = customer;
  }
  if (profile_opt->count() > 0) {
    options.config.profile = profile;
  }
  if (root_opt->count() > 0) {
    options.config.system_root = system_root;
  }

  HwidApplication hwid_app(options);
  return hwid_app.run(std::cout, std::cerr);
}
