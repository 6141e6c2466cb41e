/**********************************************************************
 * File:        params.h
 * Description: Class definitions of the *_VAR classes for tunable constants.
 *
 ** Licensed under the Apache License, Version 2.0 (the "License");
 ** you may not use this file except in compliance with the License.
 ** You may obtain a copy of the License at
 ** http://www.apache.org/licenses/LICENSE-2.0
 ** Unless required by applicable law or agreed to in writing, software
 ** distributed under the License is distributed on an "AS IS" BASIS,
 ** WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 ** See the License for the specific language governing permissions and
 ** limitations under the License.
 *
 **********************************************************************/

#ifndef TESSPIPE_PARAMS_H
#define TESSPIPE_PARAMS_H

#include <tesspipe/export.h> // for TESSPIPE_API

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility> // for std::move
#include <vector>

namespace tesspipe {

class IntParam;
class BoolParam;
class StringParam;
class DoubleParam;

class ParamsVectors {
  std::vector<IntParam *> _int_params;
  std::vector<BoolParam *> _bool_params;
  std::vector<StringParam *> _string_params;
  std::vector<DoubleParam *> _double_params;

public:
  std::vector<IntParam *> &int_params() {
    return _int_params;
  }
  std::vector<BoolParam *> &bool_params() {
    return _bool_params;
  }
  std::vector<StringParam *> &string_params() {
    return _string_params;
  }
  std::vector<DoubleParam *> &double_params() {
    return _double_params;
  }

  const std::vector<IntParam *> &int_params_c() const {
    return _int_params;
  }
  const std::vector<BoolParam *> &bool_params_c() const {
    return _bool_params;
  }
  const std::vector<StringParam *> &string_params_c() const {
    return _string_params;
  }
  const std::vector<DoubleParam *> &double_params_c() const {
    return _double_params;
  }
};

// Utility functions for working with tesspipe parameters.
class TESSPIPE_API ParamUtils {
public:
  // Reads a file of parameter definitions and set/modify the values therein.
  // Blank lines and lines beginning # are ignored.
  // Values may have any whitespace after the name and are the rest of line.
  static bool ReadParamsFile(const char *file, ParamsVectors *member_params);

  // Read parameters from the given file pointer.
  static bool ReadParamsFromFp(FILE *fp, ParamsVectors *member_params);

  // Set a parameter to have the given value.
  static bool SetParam(const char *name, const char *value, ParamsVectors *member_params);

  // accept both - and _ in key names, e.g. user-specified 'log-level' would match 'log_level'
  // in the database.
  static inline bool CompareKeys(const char *db_key, const char *user_key) {
    for (; *db_key && *user_key; db_key++, user_key++) {
      if (*db_key != *user_key) {
        if (*db_key == '_' && *user_key == '-')
          continue;
        return false;
      }
    }
    return (*db_key == *user_key);
  }

  // Returns the pointer to the parameter with the given name (of the
  // appropriate type) if it was found in the vector obtained from
  // GlobalParams() or in the given member_params.
  template <class T>
  static T *FindParam(const char *name, const std::vector<T *> &global_vec,
                      const std::vector<T *> &member_vec) {
    for (auto *param : global_vec) {
      if (CompareKeys(param->name_str(), name)) {
        return param;
      }
    }
    for (auto *param : member_vec) {
      if (CompareKeys(param->name_str(), name)) {
        return param;
      }
    }
    return nullptr;
  }
  // Removes the given pointer to the param from the given vector.
  template <class T>
  static void RemoveParam(T *param_ptr, std::vector<T *> *vec) {
    for (auto it = vec->begin(); it != vec->end(); ++it) {
      if (*it == param_ptr) {
        vec->erase(it);
        break;
      }
    }
  }
  // Fetches the value of the named param as a string. Returns false if not
  // found.
  static bool GetParamAsString(const char *name, const ParamsVectors *member_params,
                               std::string *value);

  // Print parameters to the given file, one `name<TAB>value[<TAB>info]` line each.
  static void PrintParams(FILE *fp, const ParamsVectors *member_params, bool print_info = true);

  // Resets all parameters back to default values;
  static void ResetToDefaults(ParamsVectors *member_params);
};

// Definition of various parameter types.
class Param {
public:
  virtual ~Param() = default;

  const char *name_str() const {
    return name_;
  }
  const char *info_str() const {
    return info_;
  }

  virtual std::string formatted_value_str() const = 0;

  Param(const Param &o) = delete;
  Param(Param &&o) = delete;

  Param &operator=(const Param &other) = delete;
  Param &operator=(Param &&other) = delete;

protected:
  Param(const char *name, const char *comment) : name_(name), info_(comment) {}

  const char *name_; // name of this parameter
  const char *info_; // for --help and PrintParams
};

// Value and default of a parameter of type T. The concrete classes below
// register themselves in the ParamsVectors list for their type.
template <typename T>
class TypedParam : public Param {
public:
  operator const T &() const {
    return value_;
  }
  void operator=(const T &value) {
    value_ = value;
  }
  void set_value(const T &value) {
    value_ = value;
  }
  const T &value() const {
    return value_;
  }
  void ResetToDefault() {
    value_ = default_;
  }

protected:
  TypedParam(T value, const char *name, const char *comment, ParamsVectors *vec)
      : Param(name, comment), value_(value), default_(std::move(value)), params_vec_(vec) {}

  T value_;
  T default_;

  // The vector that contains this param (not owned). Used by the destructor.
  ParamsVectors *params_vec_;
};

class IntParam : public TypedParam<int32_t> {
public:
  IntParam(int32_t value, const char *name, const char *comment, ParamsVectors *vec)
      : TypedParam(value, name, comment, vec) {
    vec->int_params().push_back(this);
  }
  ~IntParam() override {
    ParamUtils::RemoveParam<IntParam>(this, &params_vec_->int_params());
  }
  using TypedParam::operator=;

  std::string formatted_value_str() const override {
    return std::to_string(value_);
  }
};

class BoolParam : public TypedParam<bool> {
public:
  BoolParam(bool value, const char *name, const char *comment, ParamsVectors *vec)
      : TypedParam(value, name, comment, vec) {
    vec->bool_params().push_back(this);
  }
  ~BoolParam() override {
    ParamUtils::RemoveParam<BoolParam>(this, &params_vec_->bool_params());
  }
  using TypedParam::operator=;

  std::string formatted_value_str() const override {
    return value_ ? "true" : "false";
  }
};

class StringParam : public TypedParam<std::string> {
public:
  StringParam(const char *value, const char *name, const char *comment, ParamsVectors *vec)
      : TypedParam(value, name, comment, vec) {
    vec->string_params().push_back(this);
  }
  ~StringParam() override {
    ParamUtils::RemoveParam<StringParam>(this, &params_vec_->string_params());
  }
  using TypedParam::operator=;

  const char *c_str() const {
    return value_.c_str();
  }
  bool empty() const {
    return value_.empty();
  }
  bool operator==(const std::string &other) const {
    return value_ == other;
  }

  std::string formatted_value_str() const override {
    return value_;
  }
};

class DoubleParam : public TypedParam<double> {
public:
  DoubleParam(double value, const char *name, const char *comment, ParamsVectors *vec)
      : TypedParam(value, name, comment, vec) {
    vec->double_params().push_back(this);
  }
  ~DoubleParam() override {
    ParamUtils::RemoveParam<DoubleParam>(this, &params_vec_->double_params());
  }
  using TypedParam::operator=;

  // Shortest representation that reads back to the same value.
  std::string formatted_value_str() const override;
};

// Global parameter lists.
//
// To avoid the problem of undetermined order of static initialization
// global_params are accessed through the GlobalParams function that
// initializes the static pointer to global_params only on the first time
// GlobalParams() is called.
TESSPIPE_API
ParamsVectors *GlobalParams();

#define INT_VAR_H(name) ::tesspipe::IntParam name

#define BOOL_VAR_H(name) ::tesspipe::BoolParam name

#define STRING_VAR_H(name) ::tesspipe::StringParam name

#define DOUBLE_VAR_H(name) ::tesspipe::DoubleParam name

#define INT_VAR(name, val, comment) \
  ::tesspipe::IntParam name(val, #name, comment, ::tesspipe::GlobalParams())

#define BOOL_VAR(name, val, comment) \
  ::tesspipe::BoolParam name(val, #name, comment, ::tesspipe::GlobalParams())

#define STRING_VAR(name, val, comment) \
  ::tesspipe::StringParam name(val, #name, comment, ::tesspipe::GlobalParams())

#define DOUBLE_VAR(name, val, comment) \
  ::tesspipe::DoubleParam name(val, #name, comment, ::tesspipe::GlobalParams())

} // namespace tesspipe

#endif
