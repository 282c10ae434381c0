#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace gaitrank::config {

/*
  Parses a YAML file into a protobuf message.

  YAML -> google.protobuf.Value -> JSON -> message. Unknown fields are
  rejected. Plain scalars are typed (true/false, numbers); quoted scalars
  always stay strings so names like "1" or "true" survive.

  Throws std::runtime_error naming `what` and the path on any failure.
*/
void LoadYamlMessage(const std::string& path, const std::string& what, google::protobuf::Message* out);

} // namespace gaitrank::config
