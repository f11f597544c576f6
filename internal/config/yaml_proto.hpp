#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <yaml-cpp/yaml.h>

namespace meshdeploy::config {

/*
  YAML -> protobuf through the JSON mapping.

  Plain scalars that look like booleans or numbers become JSON booleans and
  numbers; quoted scalars always stay strings. Unknown fields are rejected.
  Throws util::ConfigError naming `what`.
*/
void ParseYamlInto(const YAML::Node& node, google::protobuf::Message* message, const std::string& what);

void LoadYamlFileInto(const std::string& path, google::protobuf::Message* message);

} // namespace meshdeploy::config
