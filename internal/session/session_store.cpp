#include "session_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace cloudstrap::session {
namespace fs = std::filesystem;

namespace {

constexpr const char* kSessionPrefix  = "session_";
constexpr const char* kSummaryFile    = "resources_summary.txt";
constexpr std::size_t kRuleWidth      = 70;
constexpr int         kMaxIdAttempts  = 1000;
constexpr const char* kTimestampFormat = "%Y-%m-%d %H:%M:%S";

const std::vector<Stage>& AllStages() {
  static const std::vector<Stage> kStages = {Stage::kSpecification, Stage::kNetwork, Stage::kCompute, Stage::kDatabase,
                                             Stage::kError};
  return kStages;
}

int Ordinal(Stage stage) {
  switch (stage) {
    case Stage::kSpecification:
      return 0;
    case Stage::kNetwork:
      return 1;
    case Stage::kCompute:
      return 2;
    case Stage::kDatabase:
      return 3;
    case Stage::kError:
      return 99;
  }
  return 98;
}

void WriteBlock(std::ostream& out, const std::string& title, const Snapshot& snapshot) {
  out << "Stage: " << title << "\n";
  out << "Timestamp: " << util::FormatLocal(util::Now(), kTimestampFormat) << "\n";
  out << std::string(kRuleWidth, '=') << "\n";
  for (const auto& [key, value] : snapshot) {
    out << key << ": " << value << "\n";
  }
  out << "\n";
}

} // namespace

const char* ToString(Stage stage) {
  switch (stage) {
    case Stage::kSpecification:
      return "specification";
    case Stage::kNetwork:
      return "network";
    case Stage::kCompute:
      return "compute";
    case Stage::kDatabase:
      return "database";
    case Stage::kError:
      return "error";
  }
  return "unknown";
}

std::string StageFileName(Stage stage) {
  const int   ordinal = Ordinal(stage);
  std::string prefix  = ordinal < 10 ? "0" + std::to_string(ordinal) : std::to_string(ordinal);
  return prefix + "_" + ToString(stage) + "_info.txt";
}

SessionStore::SessionStore(fs::path root) : root_(std::move(root)) {
  if (root_.empty()) {
    root_ = DefaultRoot();
  }
}

fs::path SessionStore::DefaultRoot() {
  const char* home = std::getenv("HOME");
  return fs::path(home != nullptr && *home != '\0' ? home : ".") / ".cloudstrap" / "session";
}

Session SessionStore::CreateSession() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create session root " + root_.string() + ": " + ec.message());
  }

  const std::string base = util::FormatLocal(util::Now(), "session_%Y%m%d_%H%M%S");
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    Session session;
    session.id  = attempt == 0 ? base : base + "_" + std::to_string(attempt);
    session.dir = root_ / session.id;

    if (fs::create_directory(session.dir, ec)) {
      fs::permissions(session.dir, fs::perms::owner_all, fs::perm_options::replace, ec);
      if (ec) {
        CLOUDSTRAP_LOG_WARN("Cannot restrict session directory permissions",
                            {observability::StringField("dir", session.dir.string()),
                             observability::StringField("error", ec.message())});
      }
      CLOUDSTRAP_LOG_INFO("Session created", {observability::StringField("session", session.id),
                                              observability::StringField("dir", session.dir.string())});
      return session;
    }
    if (ec) {
      throw std::runtime_error("Cannot create session directory " + session.dir.string() + ": " + ec.message());
    }
  }
  throw std::runtime_error("Cannot allocate a unique session id under " + root_.string());
}

bool SessionStore::RecordStage(const Session& session, Stage stage, const Snapshot& snapshot) {
  const fs::path path = session.dir / StageFileName(stage);
  std::ofstream  out(path, std::ios::out | std::ios::app);
  if (out) {
    WriteBlock(out, ToString(stage), snapshot);
    out.flush();
  }
  if (!out) {
    CLOUDSTRAP_LOG_ERROR("Failed to write stage snapshot", {observability::StringField("session", session.id),
                                                            observability::StringField("file", path.string())});
    return false;
  }
  return true;
}

bool SessionStore::WriteSummary(const Session& session, const model::ProvisionedResources& resources) {
  const fs::path path = session.dir / kSummaryFile;
  std::ofstream  out(path, std::ios::out | std::ios::trunc);
  if (out) {
    Snapshot summary = SnapshotOf(resources);
    if (resources.compute && !resources.compute->public_ip.empty()) {
      summary.emplace_back("SSH Command", "ssh -i " + resources.compute->private_key_path + " " +
                                              resources.compute->login_account + "@" + resources.compute->public_ip);
    }
    out << "Session: " << session.id << "\n";
    WriteBlock(out, "summary", summary);
    out.flush();
  }
  if (!out) {
    CLOUDSTRAP_LOG_ERROR("Failed to write resource summary", {observability::StringField("session", session.id),
                                                              observability::StringField("file", path.string())});
    return false;
  }
  return true;
}

std::vector<Session> SessionStore::LoadSessions() const {
  std::vector<Session> sessions;
  std::error_code      ec;
  if (!fs::is_directory(root_, ec)) {
    return sessions;
  }

  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (it->is_directory(ec) && name.rfind(kSessionPrefix, 0) == 0) {
      sessions.push_back(Session{name, it->path()});
    }
  }
  if (ec) {
    CLOUDSTRAP_LOG_WARN("Session listing incomplete", {observability::StringField("root", root_.string()),
                                                       observability::StringField("error", ec.message())});
  }

  std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) { return a.id < b.id; });
  return sessions;
}

std::optional<Session> SessionStore::FindSession(const std::string& id) const {
  if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
    return std::nullopt;
  }
  const std::string full = id.rfind(kSessionPrefix, 0) == 0 ? id : kSessionPrefix + id;

  std::error_code ec;
  const fs::path  dir = root_ / full;
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }
  return Session{full, dir};
}

model::ProvisionedResources SessionStore::RecoverResources(const Session& session) const {
  model::ProvisionedResources resources;
  for (Stage stage : AllStages()) {
    const fs::path  path = session.dir / StageFileName(stage);
    std::error_code ec;
    if (fs::exists(path, ec)) {
      if (!ParseStageFile(path, resources)) {
        CLOUDSTRAP_LOG_WARN("Cannot read stage file", {observability::StringField("file", path.string())});
      }
    }
  }
  return resources;
}

bool SessionStore::RemoveSession(const Session& session, bool keep_logs) {
  std::error_code ec;
  if (keep_logs) {
    bool ok = true;
    for (const char* name : {"ssh_key", "ssh_key.pub"}) {
      fs::remove(session.dir / name, ec);
      if (ec) {
        CLOUDSTRAP_LOG_ERROR("Failed to remove key file", {observability::StringField("session", session.id),
                                                          observability::StringField("file", name),
                                                          observability::StringField("error", ec.message())});
        ok = false;
      }
    }
    return ok;
  }

  fs::remove_all(session.dir, ec);
  if (ec) {
    CLOUDSTRAP_LOG_ERROR("Failed to remove session", {observability::StringField("session", session.id),
                                                      observability::StringField("error", ec.message())});
    return false;
  }
  CLOUDSTRAP_LOG_INFO("Session removed", {observability::StringField("session", session.id)});
  return true;
}

} // namespace cloudstrap::session
