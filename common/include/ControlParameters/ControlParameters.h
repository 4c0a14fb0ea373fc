/*! @file ControlParameters.h
 *  @brief Interface to set gains/control parameters for simulator and robot
 *  These are designed to be updated infrequently.  For high frequency data,
 * consider using Driver Inputs or adding to the Robot Debug Data instead.
 *
 * ControlParameter: a single value, either a double, an s64, a 3-vector or a
 * list of doubles.  Each value is stored inside a ControlParameters class and
 * registered in its ControlParameterCollection under its name.
 *
 * ControlParameters: a set of named values, loaded together from one YAML
 * file.  A parameter set is "fully initialized" once every value in it has
 * been set.
 *
 * To declare a parameter set, inherit from ControlParameters and use the
 * DECLARE_PARAMETER / INIT_PARAMETER macros:
 *
 *  class MyParameters : public ControlParameters {
 *   public:
 *    MyParameters()
 *        : ControlParameters("my-parameters"),
 *          INIT_PARAMETER(myGain) {}
 *    DECLARE_PARAMETER(double, myGain)
 *  };
 */

#ifndef WOOFER_CONTROLPARAMETERS_H
#define WOOFER_CONTROLPARAMETERS_H

#include <map>
#include <string>
#include <vector>

#include "cppTypes.h"

#define CONTROL_PARAMETER_COLLECTION_KEY "__collection-name__"

#define INIT_PARAMETER(name) param_##name(#name, name, collection)

#define DECLARE_PARAMETER(type, name) \
  type name;                          \
  ControlParameter param_##name;

enum class ControlParameterValueKind : u64 {
  DOUBLE = 1,
  S64 = 2,
  VEC3_DOUBLE = 3,
  VEC_DOUBLE = 4
};

std::string controlParameterValueKindToString(ControlParameterValueKind kind);

class ControlParameter;

/*!
 * ControlParameterCollection contains a map of all the control parameters.
 */
class ControlParameterCollection {
 public:
  explicit ControlParameterCollection(const std::string& name) : _name(name) {}

  /*!
   * Use this to add a parameter for the first time in the constructor of a
   * ControlParameters class.  Throws if a parameter of the same name exists.
   */
  void addParameter(ControlParameter* param, const std::string& name);

  /*!
   * Lookup a control parameter by its name.  Throws if the name is unknown.
   */
  ControlParameter& lookup(const std::string& name);

  std::string printToYamlString();
  bool checkIfAllSet();
  const std::string& name() const { return _name; }

  std::map<std::string, ControlParameter*> _map;

 private:
  std::string _name;
};

/*!
 * One named value, bound to a member of a ControlParameters class
 */
class ControlParameter {
 public:
  ControlParameter(const std::string& name, double& value,
                   ControlParameterCollection& collection,
                   const std::string& units = "");
  ControlParameter(const std::string& name, s64& value,
                   ControlParameterCollection& collection,
                   const std::string& units = "");
  ControlParameter(const std::string& name, Vec3<double>& value,
                   ControlParameterCollection& collection,
                   const std::string& units = "");
  ControlParameter(const std::string& name, std::vector<double>& value,
                   ControlParameterCollection& collection,
                   const std::string& units = "");

  ControlParameter(const ControlParameter&) = delete;
  ControlParameter& operator=(const ControlParameter&) = delete;

  void set(double value);
  void set(s64 value);
  void set(const Vec3<double>& value);
  void set(const std::vector<double>& value);

  std::string toString();

  bool _set = false;
  std::string _name;
  std::string _units;
  ControlParameterValueKind _kind;

 private:
  void checkKind(ControlParameterValueKind kind);

  double* _double = nullptr;
  s64* _s64 = nullptr;
  Vec3<double>* _vec3 = nullptr;
  std::vector<double>* _vec = nullptr;
};

/*!
 * Parent class for groups of parameters
 */
class ControlParameters {
 public:
  explicit ControlParameters(const std::string& name)
      : collection(name), _name(name) {}

  ControlParameters(const ControlParameters&) = delete;
  ControlParameters& operator=(const ControlParameters&) = delete;
  virtual ~ControlParameters() = default;

  /*!
   * Load every parameter present in a YAML file.  The file's
   * __collection-name__ must match this parameter set.
   */
  void initializeFromYamlFile(const std::string& path);

  /*!
   * Same as initializeFromYamlFile, reading from a string
   */
  void initializeFromYamlString(const std::string& yaml);

  bool isFullyInitialized() { return collection.checkIfAllSet(); }

  /*!
   * Names of all parameters which have not been set, one per line
   */
  std::string generateUnitializedList();

  const std::string& name() const { return _name; }

  ControlParameterCollection collection;

 protected:
  std::string _name;
};

#endif  // WOOFER_CONTROLPARAMETERS_H
