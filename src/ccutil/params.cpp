/**********************************************************************
 * File:        params.cpp
 * Description: Initialization and setting of tesspipe parameters.
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
 **********************************************************************/

#include <tesspipe/params.h>

#include <tesspipe/fileptr.h>
#include <tesspipe/tprintf.h>

#include "strutils.h"

#include <cctype>  // for isspace
#include <cstring> // for strlen

namespace tesspipe {

ParamsVectors *GlobalParams() {
  static ParamsVectors global_params;
  return &global_params;
}

std::string DoubleParam::formatted_value_str() const {
  return fmt::format("{}", value_);
}

bool ParamUtils::ReadParamsFile(const char *file, ParamsVectors *member_params) {
  FileHandle fp(fopen(file, "rb"));
  if (!fp) {
    tprintError("read_params_file: Can't open file {}\n", file);
    return false;
  }
  return ReadParamsFromFp(fp.get(), member_params);
}

bool ParamUtils::ReadParamsFromFp(FILE *fp, ParamsVectors *member_params) {
  char line[4096];
  bool anyerr = false; // true if any error
  int lineno = 0;

  while (fgets(line, sizeof(line), fp) != nullptr) {
    lineno++;
    // trim trailing CR/LF
    size_t len = strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
      line[--len] = '\0';
    }
    char *nameptr = line;
    while (*nameptr && isspace(static_cast<unsigned char>(*nameptr))) {
      nameptr++;
    }
    if (*nameptr == '\0' || *nameptr == '#') {
      continue;
    }
    char *valptr = nameptr;
    while (*valptr && !isspace(static_cast<unsigned char>(*valptr))) {
      valptr++;
    }
    if (*valptr) {
      *valptr++ = '\0';
      while (*valptr && isspace(static_cast<unsigned char>(*valptr))) {
        valptr++;
      }
    }
    if (!SetParam(nameptr, valptr, member_params)) {
      anyerr = true;
      tprintError("Failed to set parameter `{}` from line {}: `{}`\n", nameptr, lineno, valptr);
    }
  }
  return !anyerr;
}

bool ParamUtils::SetParam(const char *name, const char *value, ParamsVectors *member_params) {
  static const ParamsVectors empty;
  const ParamsVectors &member = (member_params != nullptr) ? *member_params : empty;
  ParamsVectors *globals = GlobalParams();

  auto *sp = FindParam<StringParam>(name, globals->string_params_c(), member.string_params_c());
  if (sp != nullptr) {
    sp->set_value(value);
    return true;
  }

  auto *ip = FindParam<IntParam>(name, globals->int_params_c(), member.int_params_c());
  if (ip != nullptr) {
    int intval;
    if (!SafeAtoi(value, &intval)) {
      tprintError("Could not parse int from `{}` for parameter {}\n", value, name);
      return false;
    }
    ip->set_value(intval);
    return true;
  }

  auto *bp = FindParam<BoolParam>(name, globals->bool_params_c(), member.bool_params_c());
  if (bp != nullptr) {
    bool boolval;
    if (!SafeAtob(value, &boolval)) {
      tprintError("Could not parse bool from `{}` for parameter {}\n", value, name);
      return false;
    }
    bp->set_value(boolval);
    return true;
  }

  auto *dp = FindParam<DoubleParam>(name, globals->double_params_c(), member.double_params_c());
  if (dp != nullptr) {
    double doubleval;
    if (!SafeAtod(value, &doubleval)) {
      tprintError("Could not parse double from `{}` for parameter {}\n", value, name);
      return false;
    }
    dp->set_value(doubleval);
    return true;
  }

  tprintWarn("Unknown parameter `{}`\n", name);
  return false;
}

bool ParamUtils::GetParamAsString(const char *name, const ParamsVectors *member_params,
                                  std::string *value) {
  static const ParamsVectors empty;
  const ParamsVectors &member = (member_params != nullptr) ? *member_params : empty;
  const ParamsVectors *globals = GlobalParams();

  auto *sp = FindParam<StringParam>(name, globals->string_params_c(), member.string_params_c());
  if (sp != nullptr) {
    *value = sp->formatted_value_str();
    return true;
  }
  auto *ip = FindParam<IntParam>(name, globals->int_params_c(), member.int_params_c());
  if (ip != nullptr) {
    *value = ip->formatted_value_str();
    return true;
  }
  auto *bp = FindParam<BoolParam>(name, globals->bool_params_c(), member.bool_params_c());
  if (bp != nullptr) {
    *value = bp->formatted_value_str();
    return true;
  }
  auto *dp = FindParam<DoubleParam>(name, globals->double_params_c(), member.double_params_c());
  if (dp != nullptr) {
    *value = dp->formatted_value_str();
    return true;
  }
  return false;
}

void ParamUtils::PrintParams(FILE *fp, const ParamsVectors *member_params, bool print_info) {
  if (fp == nullptr) {
    fp = stdout;
  }
  const ParamsVectors *vecs[2] = {GlobalParams(), member_params};
  for (const auto *vec : vecs) {
    if (vec == nullptr) {
      continue;
    }
    auto print = [fp, print_info](const Param *p) {
      if (print_info) {
        fmt::print(fp, "{}\t{}\t{}\n", p->name_str(), p->formatted_value_str(), p->info_str());
      } else {
        fmt::print(fp, "{}\t{}\n", p->name_str(), p->formatted_value_str());
      }
    };
    for (auto *p : vec->int_params_c()) {
      print(p);
    }
    for (auto *p : vec->bool_params_c()) {
      print(p);
    }
    for (auto *p : vec->string_params_c()) {
      print(p);
    }
    for (auto *p : vec->double_params_c()) {
      print(p);
    }
  }
}

void ParamUtils::ResetToDefaults(ParamsVectors *member_params) {
  ParamsVectors *vecs[2] = {GlobalParams(), member_params};
  for (auto *vec : vecs) {
    if (vec == nullptr) {
      continue;
    }
    for (auto *p : vec->int_params()) {
      p->ResetToDefault();
    }
    for (auto *p : vec->bool_params()) {
      p->ResetToDefault();
    }
    for (auto *p : vec->string_params()) {
      p->ResetToDefault();
    }
    for (auto *p : vec->double_params()) {
      p->ResetToDefault();
    }
  }
}

} // namespace tesspipe
