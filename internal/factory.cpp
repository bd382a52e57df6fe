#include "factory.hpp"

#include "internal/db/memory/memory_status_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_status_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace inkvault::factory {

using inkvault::observability::StringField;

std::shared_ptr<db::StatusRepository> BuildStatusRepository(const inkvault::runtime::config::RuntimeConfig& config) {
  const auto& path = config.catalog().sqlite_path();
  if (path.empty()) {
    INKVAULT_LOG_INFO("status catalog in memory");
    return std::make_shared<db::memory::MemoryStatusRepository>();
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  INKVAULT_LOG_INFO("status catalog opened", {StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteStatusRepository>(std::move(sqlite_db));
}

session::SessionRegistryOptions BuildSessionOptions(const inkvault::runtime::config::RuntimeConfig& config) {
  session::SessionRegistryOptions options;
  options.storage_root         = config.storage().root();
  options.fsync                = config.storage().fsync();
  options.coordinate_tolerance = config.change_detection().coordinate_tolerance();

  const auto& autosave         = config.autosave();
  options.tick_interval        = util::FromProto(autosave.tick_interval(), std::chrono::seconds(1));
  options.timings.grace_window = util::FromProto(autosave.grace_window(), std::chrono::seconds(2));
  options.timings.load_timeout = util::FromProto(autosave.load_timeout(), std::chrono::seconds(30));
  return options;
}

Application Build(const inkvault::runtime::config::RuntimeConfig& config) {
  Application app;
  app.status   = BuildStatusRepository(config);
  app.sessions = std::make_shared<session::SessionRegistry>(BuildSessionOptions(config), app.status);

  INKVAULT_LOG_INFO("inkvault ready", {StringField("storage_root", config.storage().root())});
  return app;
}

} // namespace inkvault::factory
