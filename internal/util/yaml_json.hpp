#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

namespace impact::util {

/*
  Converts a YAML document into protobuf JSON text, so that it can be
  parsed into a message with JsonStringToMessage.

  Plain true/false become JSON booleans and plain finite decimals become
  numbers. Everything else, quoted scalars and spellings such as nan, inf
  or 0x1F included, stays a string. JSON input is valid YAML
  and passes through unchanged in meaning.

  Throws std::runtime_error on unsupported nodes.
*/
std::string YamlToJson(const YAML::Node& node);

} // namespace impact::util
