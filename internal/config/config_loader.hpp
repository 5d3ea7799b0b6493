#pragma once

#include <string>

#include "config/config.pb.h"

namespace dbmgr::config {

/*
  Loads ManagerConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static dbmgr::runtime::config::ManagerConfig LoadFromYaml(const std::string& path);
  static dbmgr::runtime::config::ManagerConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace dbmgr::config
