#include <iostream>
#include <string>

#include "internal/cleanup/session_cleanup.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

void Usage() {
  std::cerr << "Usage:\n"
            << "  cloudstrap-cleanup [--config <config.yaml>] --list\n"
            << "  cloudstrap-cleanup [--config <config.yaml>] <session_id> [--cloud-only|--local-only] [--keep-logs] [--yes]\n";
}

void Shutdown() {
  cloudstrap::observability::ShutdownLogging();
  cloudstrap::observability::ShutdownTracing();
}

int List(cloudstrap::session::SessionStore& store) {
  const auto sessions = store.LoadSessions();
  if (sessions.empty()) {
    std::cout << "No sessions under " << store.root().string() << "\n";
    return 0;
  }
  for (const auto& session : sessions) {
    const auto resources = store.RecoverResources(session);
    std::cout << session.id << "  region=" << (resources.region.empty() ? "-" : resources.region)
              << "  network=" << (resources.network_id.empty() ? "-" : resources.network_id)
              << "  instance=" << (resources.compute ? resources.compute->instance_id : "-")
              << "  database=" << (resources.database ? resources.database->instance_id : "-") << "\n";
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  using cloudstrap::cleanup::CleanupOptions;
  using cloudstrap::cleanup::CleanupScope;

  std::string    config_path;
  std::string    session_id;
  bool           list = false;
  CleanupOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--list") {
      list = true;
    } else if (arg == "--cloud-only") {
      options.scope = CleanupScope::kCloudOnly;
    } else if (arg == "--local-only") {
      options.scope = CleanupScope::kLocalOnly;
    } else if (arg == "--keep-logs") {
      options.keep_logs = true;
    } else if (arg == "--yes") {
      options.dry_run = false;
    } else if (!arg.empty() && arg[0] != '-' && session_id.empty()) {
      session_id = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (list == !session_id.empty()) {
    Usage();
    return 1;
  }

  try {
    cloudstrap::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = cloudstrap::config::ConfigLoader::LoadFromYaml(config_path);
    }
    cloudstrap::observability::InitializeTracing(config);
    cloudstrap::observability::InitializeLogging(config);

    auto store = cloudstrap::factory::BuildSessionStore(config);
    if (list) {
      const int rc = List(*store);
      Shutdown();
      return rc;
    }

    const auto session = store->FindSession(session_id);
    if (!session) {
      std::cerr << "Session not found: " << session_id << " (under " << store->root().string() << ")" << std::endl;
      Shutdown();
      return 1;
    }

    const auto plan = cloudstrap::cleanup::DescribePlan(store->RecoverResources(*session), options);
    std::cout << (options.dry_run ? "Would " : "Will ") << "clean up " << session->id << ":\n";
    for (const auto& line : plan) {
      std::cout << "  - " << line << "\n";
    }
    if (options.dry_run) {
      std::cout << "Re-run with --yes to proceed.\n";
      Shutdown();
      return 0;
    }

    const auto result = cloudstrap::cleanup::CleanupSession(
        *store, *session, options,
        [&config](const std::string& region) { return cloudstrap::factory::BuildProvider(config, region); },
        cloudstrap::factory::TeardownGrace(config));

    int rc = 0;
    if (result.report) {
      for (const auto& step : result.report->steps) {
        std::cout << "  " << step.resource << " " << step.id << ": " << cloudstrap::cleanup::ToString(step.outcome);
        if (!step.error.empty()) {
          std::cout << " (" << step.error << ")";
        }
        std::cout << "\n";
      }
      if (!result.report->Complete()) {
        std::cerr << "Cleanup incomplete; local session files kept for retry." << std::endl;
        rc = 2;
      }
    }
    if (result.local_removed) {
      std::cout << "Local session files removed.\n";
    }
    Shutdown();
    return rc;
  } catch (const std::exception& e) {
    CLOUDSTRAP_LOG_ERROR("Cleanup failed", {cloudstrap::observability::StringField("error", e.what())});
    std::cerr << "Cleanup failed: " << e.what() << std::endl;
    Shutdown();
    return 2;
  }
}
