#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/provisioned_resources.hpp"
#include "internal/session/snapshot.hpp"

namespace cloudstrap::session {

enum class Stage {
  kSpecification,
  kNetwork,
  kCompute,
  kDatabase,
  kError,
};

const char* ToString(Stage stage);

// "00_specification_info.txt", "01_network_info.txt", ...
std::string StageFileName(Stage stage);

struct Session {
  std::string           id; // session_YYYYmmdd_HHMMSS[_N]
  std::filesystem::path dir;
};

/*
  On-disk record of provisioning runs.

  Layout:
    <root>/session_<ts>/NN_<stage>_info.txt   append-only stage blocks
    <root>/session_<ts>/ssh_key, ssh_key.pub  generated key pair
    <root>/session_<ts>/resources_summary.txt final summary

  Writes never throw; failures are logged and reported through the return
  value so a storage problem cannot mask the provisioning outcome.
*/
class SessionStore {
 public:
  explicit SessionStore(std::filesystem::path root);

  // $HOME/.cloudstrap/session
  static std::filesystem::path DefaultRoot();

  const std::filesystem::path& root() const {
    return root_;
  }

  // Throws std::runtime_error if the directory cannot be created.
  Session CreateSession();

  bool RecordStage(const Session& session, Stage stage, const Snapshot& snapshot);
  bool WriteSummary(const Session& session, const model::ProvisionedResources& resources);

  // Sorted by id, oldest first.
  std::vector<Session> LoadSessions() const;

  // Accepts the id with or without the "session_" prefix.
  std::optional<Session> FindSession(const std::string& id) const;

  // Re-parses every stage file of the session; later values win.
  model::ProvisionedResources RecoverResources(const Session& session) const;

  // keep_logs removes only the key pair and leaves the stage files.
  bool RemoveSession(const Session& session, bool keep_logs);

 private:
  std::filesystem::path root_;
};

} // namespace cloudstrap::session
