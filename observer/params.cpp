#include "params.hpp"

#include <stdlib.h>

#include <glog/logging.h>
#include <stout/strings.hpp>

namespace {
  size_t to_uint(const std::string& key, const std::string& v) {
    char* invalid = NULL;
    long val = strtol(v.c_str(), &invalid, 10);
    if (v.empty() || (invalid != NULL && invalid[0] != '\0')) {
      LOG(FATAL) << "Invalid config value (must be int): " << key << "=" << v;
    }
    if (val < 0) {
      LOG(FATAL) << "Invalid config value (must be non-negative): " << key << "=" << v;
    }
    return (size_t) val;
  }

  bool to_bool(const std::string& key, const std::string& v) {
    if (v.empty()) {
      LOG(FATAL) << "Invalid config value (must be non-empty): " << key << " = " << v;
      return false;
    }
    switch (v[0]) {
      case 't':
      case 'y':
      case '1':
        return true;
      case 'f':
      case 'n':
      case '0':
        return false;
      default: {
        LOG(FATAL) << "Invalid config value (must start with 't','y','1' (true) or 'f','n','0' (false)): " << key << " = " << v;
        return false;
      }
    }
  }
}

std::string observer::params::get_str(
    const Parameters& parameters, const std::string& key, const std::string& default_value) {
  for (const Parameter& parameter : parameters.parameter()) {
    if (parameter.key() == key) {
      const std::string& v = parameter.value();
      if (v.empty()) {
        LOG(FATAL) << "Invalid config value (must be non-empty): " << key << " = " << v;
      }
      return v;
    }
  }
  return default_value;
}

size_t observer::params::get_uint(
    const Parameters& parameters, const std::string& key, size_t default_value) {
  for (const Parameter& parameter : parameters.parameter()) {
    if (parameter.key() == key) {
      return to_uint(key, parameter.value());
    }
  }
  return default_value;
}

bool observer::params::get_bool(
    const Parameters& parameters, const std::string& key, bool default_value) {
  for (const Parameter& parameter : parameters.parameter()) {
    if (parameter.key() == key) {
      return to_bool(key, parameter.value());
    }
  }
  return default_value;
}

std::vector<std::string> observer::params::get_list(
    const Parameters& parameters, const std::string& key) {
  std::vector<std::string> entries;
  for (const Parameter& parameter : parameters.parameter()) {
    if (parameter.key() != key) {
      continue;
    }
    for (const std::string& token : strings::tokenize(parameter.value(), ",")) {
      std::string entry = strings::trim(token);
      if (!entry.empty()) {
        entries.push_back(entry);
      }
    }
    // Only the first occurrence is used, consistent with the other getters.
    break;
  }
  return entries;
}
