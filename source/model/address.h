// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <optional>

#include "utils/json.h"

namespace cpca::model
{
/**
 * A single row of the administrative gazetteer.
 *
 * The district is absent for prefecture-level cities that have no
 * county-level subdivision (such as Dongguan or Zhongshan).
 */
struct administrative_record
{
  std::string province;
  std::string city;
  std::optional<std::string> district;

  /**
   * Province, city and district concatenated without separators.
   */
  std::string full_name() const;

  bool operator==(administrative_record const& other) const;
  bool operator!=(administrative_record const& other) const;
};

/**
 * The outcome of parsing one free-form address string.
 *
 * Every administrative level is optional, an unrecognized level is
 * left empty rather than guessed. Whatever text was not consumed by
 * the recognized levels ends up in detail.
 */
struct parsed_address
{
  std::optional<std::string> province;
  std::optional<std::string> city;
  std::optional<std::string> district;
  std::string detail;

  bool has_province() const;
  bool has_city() const;
  bool has_district() const;

  /**
   * True when province, city and district were all resolved.
   */
  bool is_complete() const;

  /**
   * Reassembles the address in its canonical form. A municipality
   * is both province and city, so its name is emitted only once.
   */
  std::string full_address() const;

  json_t to_json() const;

  bool operator==(parsed_address const& other) const;
  bool operator!=(parsed_address const& other) const;
};

}  // namespace cpca::model
