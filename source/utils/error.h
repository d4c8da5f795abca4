// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <stdexcept>

namespace cpca
{
/**
 * Thrown when the gazetteer file is missing, unreadable
 * or does not contain a single usable record.
 */
class data_load_error : public std::runtime_error
{
public:
  data_load_error();
  data_load_error(const char* msg);
};

/**
 * Thrown when a service request could not be parsed
 * or has some missing or invalid fields.
 */
class bad_request : public std::runtime_error
{
public:
  bad_request();
  bad_request(const char* msg);
};

/**
 * Thrown when a request attempts to invoke a non-existing service method.
 */
class bad_method : public std::runtime_error
{
public:
  bad_method();
  bad_method(const char* msg);
};

}  // namespace cpca
