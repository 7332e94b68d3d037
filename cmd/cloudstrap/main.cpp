#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/config/resource_spec_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/interrupt.hpp"

namespace {

void HandleSignal(int) {
  cloudstrap::util::RequestInterrupt();
}

void Usage() {
  std::cerr << "Usage: cloudstrap [--config <config.yaml>] --spec <resource_spec.json|yaml> [--region <region>]" << std::endl;
}

void Shutdown() {
  cloudstrap::observability::ShutdownLogging();
  cloudstrap::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string spec_path;
  std::string region;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--spec") {
      spec_path = argv[++i];
    } else if (arg == "--region") {
      region = argv[++i];
    } else {
      Usage();
      return 1;
    }
  }
  if (spec_path.empty()) {
    Usage();
    return 1;
  }

  cloudstrap::factory::Application app;
  try {
    // ------------------------------------------------------------
    // Load configuration and request
    // ------------------------------------------------------------
    cloudstrap::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = cloudstrap::config::ConfigLoader::LoadFromYaml(config_path);
    }

    cloudstrap::observability::InitializeTracing(config);
    cloudstrap::observability::InitializeLogging(config);

    auto spec = cloudstrap::config::LoadResourceSpec(spec_path);
    if (!region.empty()) {
      spec.set_region(region);
    }
    cloudstrap::config::ValidateResourceSpec(spec, cloudstrap::factory::MinDiskGb(config));

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    app = cloudstrap::factory::Build(config, cloudstrap::factory::BuildProvider(config, spec.region()));

    // Register signal handlers before the first provider call.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const auto result = app.orchestrator->Provision(spec);

    std::cout << "Session: " << result.session.id << "\n";
    std::cout << "Session directory: " << result.session.dir.string() << "\n";
    if (result.remote_access) {
      const auto& access = *result.remote_access;
      std::cout << "Compute ready at " << access.public_address << "\n";
      std::cout << "  ssh -i " << access.private_key_path << " " << access.login_account << "@" << access.public_address
                << "\n";
    }
    if (result.resources.database) {
      const auto& db = *result.resources.database;
      std::cout << "Database ready at " << db.host << ":" << db.port << " (user " << db.username
                << ", password in the session summary)\n";
    }
  } catch (const std::exception& e) {
    CLOUDSTRAP_LOG_ERROR("Provisioning failed", {cloudstrap::observability::StringField("error", e.what())});
    std::cerr << "Provisioning failed: " << e.what() << std::endl;
    if (app.orchestrator && app.orchestrator->session()) {
      std::cerr << "Session directory: " << app.orchestrator->session()->dir.string() << std::endl;
      const auto& report = app.orchestrator->last_teardown();
      if (report && !report->Complete()) {
        std::cerr << "Cleanup incomplete; retry with: cloudstrap-cleanup " << app.orchestrator->session()->id << " --yes"
                  << std::endl;
      }
    }
    Shutdown();
    return 2;
  }

  Shutdown();
  return 0;
}
