#include "config_loader.hpp"

#include "internal/config/yaml_proto.hpp"

namespace gaitrank::config {

gaitrank::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  gaitrank::runtime::config::RuntimeConfig config;
  LoadYamlMessage(path, "configuration", &config);
  return config;
}

} // namespace gaitrank::config
