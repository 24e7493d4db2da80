/*!
 * String helpers used by the configuration layer, adapted from LightGBM's
 * common utilities, which carry the following copyright information:
 *
 * Copyright (c) 2016 Microsoft Corporation. All rights reserved.
 * Licensed under the MIT License. See LICENSE file in the project root for license information.
 */
#ifndef BAYESTREE_COMMON_H_
#define BAYESTREE_COMMON_H_

#include <bayestree/log.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

namespace BayesTree {

namespace Common {

inline static std::string Trim(std::string str) {
  if (str.empty()) {
    return str;
  }
  str.erase(str.find_last_not_of(" \f\n\r\t\v") + 1);
  str.erase(0, str.find_first_not_of(" \f\n\r\t\v"));
  return str;
}

inline static std::string RemoveQuotationSymbol(std::string str) {
  if (str.empty()) {
    return str;
  }
  str.erase(str.find_last_not_of("'\"") + 1);
  str.erase(0, str.find_first_not_of("'\""));
  return str;
}

inline static std::vector<std::string> Split(const char* c_str, char delimiter) {
  std::vector<std::string> ret;
  std::string str(c_str);
  size_t i = 0;
  size_t pos = 0;
  while (pos < str.length()) {
    if (str[pos] == delimiter) {
      if (i < pos) {
        ret.push_back(str.substr(i, pos - i));
      }
      ++pos;
      i = pos;
    } else {
      ++pos;
    }
  }
  if (i < pos) {
    ret.push_back(str.substr(i));
  }
  return ret;
}

inline static std::vector<std::string> Split(const char* c_str, const char* delimiters) {
  std::vector<std::string> ret;
  std::string str(c_str);
  std::string delims(delimiters);
  size_t i = 0;
  size_t pos = 0;
  while (pos < str.length()) {
    if (delims.find(str[pos]) != std::string::npos) {
      if (i < pos) {
        ret.push_back(str.substr(i, pos - i));
      }
      ++pos;
      i = pos;
    } else {
      ++pos;
    }
  }
  if (i < pos) {
    ret.push_back(str.substr(i));
  }
  return ret;
}

/*! \brief Parse an integer, returning false if `p` is not entirely an integer */
inline static bool AtoiAndCheck(const char* p, int* out) {
  char* end = nullptr;
  errno = 0;
  long value = std::strtol(p, &end, 10);
  if (end == p || errno == ERANGE) {
    return false;
  }
  while (std::isspace(static_cast<unsigned char>(*end))) ++end;
  if (*end != '\0') {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

/*! \brief Parse a double, returning false if `p` is not entirely a number */
inline static bool AtofAndCheck(const char* p, double* out) {
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(p, &end);
  if (end == p || errno == ERANGE) {
    return false;
  }
  while (std::isspace(static_cast<unsigned char>(*end))) ++end;
  if (*end != '\0') {
    return false;
  }
  *out = value;
  return true;
}

}  // namespace Common

}  // namespace BayesTree

#endif  // BAYESTREE_COMMON_H_
