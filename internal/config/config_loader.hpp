#pragma once

#include <string>

#include "stash/config/v1/config.pb.h"

namespace stash::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Defaults are filled in afterwards, so callers always see a
  database backend and both escalation timings.
*/
class ConfigLoader {
 public:
  static stash::config::v1::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static stash::config::v1::RuntimeConfig Defaults();

  // Fills unset sections and expands "~/" in the sqlite path.
  static void ApplyDefaults(stash::config::v1::RuntimeConfig* config);

  // $STASH_HOME/stash.db, else $HOME/.stash/stash.db, else ./stash.db
  static std::string DefaultDatabasePath();
};

} // namespace stash::config
