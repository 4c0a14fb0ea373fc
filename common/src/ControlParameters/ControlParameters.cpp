/*! @file ControlParameters.cpp
 *  @brief Interface to set gains/control parameters for simulator and robot
 *
 */

#include "ControlParameters/ControlParameters.h"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

std::string controlParameterValueKindToString(
    ControlParameterValueKind kind) {
  switch (kind) {
    case ControlParameterValueKind::DOUBLE:
      return "double";
    case ControlParameterValueKind::S64:
      return "s64";
    case ControlParameterValueKind::VEC3_DOUBLE:
      return "vec3d";
    case ControlParameterValueKind::VEC_DOUBLE:
      return "vecd";
    default:
      return "unknown-ControlParameterValueKind";
  }
}

void ControlParameterCollection::addParameter(ControlParameter* param,
                                              const std::string& name) {
  if (_map.find(name) != _map.end()) {
    throw std::runtime_error("parameter " + name +
                             " has already been added to collection " +
                             _name);
  }
  _map[name] = param;
}

ControlParameter& ControlParameterCollection::lookup(const std::string& name) {
  auto it = _map.find(name);
  if (it == _map.end()) {
    throw std::runtime_error("parameter " + name +
                             " wasn't found in parameter collection " + _name);
  }
  return *it->second;
}

std::string ControlParameterCollection::printToYamlString() {
  std::string result = CONTROL_PARAMETER_COLLECTION_KEY ": " + _name + "\n";
  for (auto& kv : _map) {
    result += kv.first + ": " + kv.second->toString() + "\n";
  }
  return result;
}

bool ControlParameterCollection::checkIfAllSet() {
  for (auto& kv : _map) {
    if (!kv.second->_set) {
      return false;
    }
  }
  return true;
}

ControlParameter::ControlParameter(const std::string& name, double& value,
                                   ControlParameterCollection& collection,
                                   const std::string& units)
    : _name(name), _units(units), _kind(ControlParameterValueKind::DOUBLE),
      _double(&value) {
  value = 0;
  collection.addParameter(this, name);
}

ControlParameter::ControlParameter(const std::string& name, s64& value,
                                   ControlParameterCollection& collection,
                                   const std::string& units)
    : _name(name), _units(units), _kind(ControlParameterValueKind::S64),
      _s64(&value) {
  value = 0;
  collection.addParameter(this, name);
}

ControlParameter::ControlParameter(const std::string& name,
                                   Vec3<double>& value,
                                   ControlParameterCollection& collection,
                                   const std::string& units)
    : _name(name), _units(units),
      _kind(ControlParameterValueKind::VEC3_DOUBLE), _vec3(&value) {
  value.setZero();
  collection.addParameter(this, name);
}

ControlParameter::ControlParameter(const std::string& name,
                                   std::vector<double>& value,
                                   ControlParameterCollection& collection,
                                   const std::string& units)
    : _name(name), _units(units),
      _kind(ControlParameterValueKind::VEC_DOUBLE), _vec(&value) {
  value.clear();
  collection.addParameter(this, name);
}

void ControlParameter::checkKind(ControlParameterValueKind kind) {
  if (kind != _kind) {
    throw std::runtime_error("type mismatch for parameter " + _name +
                             ", it is " +
                             controlParameterValueKindToString(_kind) +
                             " but was set as " +
                             controlParameterValueKindToString(kind));
  }
}

void ControlParameter::set(double value) {
  checkKind(ControlParameterValueKind::DOUBLE);
  *_double = value;
  _set = true;
}

void ControlParameter::set(s64 value) {
  checkKind(ControlParameterValueKind::S64);
  *_s64 = value;
  _set = true;
}

void ControlParameter::set(const Vec3<double>& value) {
  checkKind(ControlParameterValueKind::VEC3_DOUBLE);
  *_vec3 = value;
  _set = true;
}

void ControlParameter::set(const std::vector<double>& value) {
  checkKind(ControlParameterValueKind::VEC_DOUBLE);
  *_vec = value;
  _set = true;
}

std::string ControlParameter::toString() {
  std::string result;
  switch (_kind) {
    case ControlParameterValueKind::DOUBLE:
      result = std::to_string(*_double);
      break;
    case ControlParameterValueKind::S64:
      result = std::to_string(*_s64);
      break;
    case ControlParameterValueKind::VEC3_DOUBLE:
      result = "[" + std::to_string((*_vec3)[0]) + ", " +
               std::to_string((*_vec3)[1]) + ", " +
               std::to_string((*_vec3)[2]) + "]";
      break;
    case ControlParameterValueKind::VEC_DOUBLE:
      result = "[";
      for (size_t i = 0; i < _vec->size(); i++) {
        if (i) result += ", ";
        result += std::to_string((*_vec)[i]);
      }
      result += "]";
      break;
  }
  if (!_set) {
    result += " # warning: not set";
  }
  return result;
}

/*!
 * Set every parameter found in a YAML map
 */
static void setParametersFromYaml(ControlParameterCollection& collection,
                                  const YAML::Node& root,
                                  const std::string& source) {
  if (!root.IsMap()) {
    throw std::runtime_error(source + " is not a YAML map");
  }

  if (!root[CONTROL_PARAMETER_COLLECTION_KEY]) {
    throw std::runtime_error(source + " has no " +
                             CONTROL_PARAMETER_COLLECTION_KEY);
  }
  std::string collectionName =
      root[CONTROL_PARAMETER_COLLECTION_KEY].as<std::string>();
  if (collectionName != collection.name()) {
    throw std::runtime_error(source + " is for collection " + collectionName +
                             ", expected " + collection.name());
  }

  for (const auto& kv : root) {
    std::string key = kv.first.as<std::string>();
    if (key == CONTROL_PARAMETER_COLLECTION_KEY) continue;

    ControlParameter& param = collection.lookup(key);
    try {
      switch (param._kind) {
        case ControlParameterValueKind::DOUBLE:
          param.set(kv.second.as<double>());
          break;
        case ControlParameterValueKind::S64:
          param.set((s64)kv.second.as<long long>());
          break;
        case ControlParameterValueKind::VEC3_DOUBLE: {
          std::vector<double> v = kv.second.as<std::vector<double>>();
          if (v.size() != 3) {
            throw std::runtime_error("parameter " + key + " in " + source +
                                     " must have 3 entries");
          }
          param.set(Vec3<double>(v[0], v[1], v[2]));
        } break;
        case ControlParameterValueKind::VEC_DOUBLE:
          param.set(kv.second.as<std::vector<double>>());
          break;
      }
    } catch (const YAML::Exception& e) {
      throw std::runtime_error("bad value for parameter " + key + " in " +
                               source + ": " + e.what());
    }
  }
}

void ControlParameters::initializeFromYamlFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to load " + path + ": " + e.what());
  }
  setParametersFromYaml(collection, root, path);
}

void ControlParameters::initializeFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("failed to parse parameters for " + _name + ": " +
                             e.what());
  }
  setParametersFromYaml(collection, root, _name);
}

std::string ControlParameters::generateUnitializedList() {
  std::string result;
  for (auto& kv : collection._map) {
    if (!kv.second->_set) {
      result += kv.second->_name + "\n";
    }
  }
  return result;
}
