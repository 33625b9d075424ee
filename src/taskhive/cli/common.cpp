#include "taskhive/cli/commands.hpp"
#include "taskhive/config/config.hpp"

namespace taskhive::cli {

auto load_system_config(const CommonOptions& opts) -> Result<SystemConfig> {
  SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  if (!opts.queue_db.empty()) {
    config.queue.path = opts.queue_db;
  }
  if (!opts.log_level.empty()) {
    config.supervisor.log_level = opts.log_level;
  }
  return config;
}

}  // namespace taskhive::cli
