// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include "json.h"
#include <boost/log/trivial.hpp>

#define tracelog BOOST_LOG_TRIVIAL(trace)
#define dbglog BOOST_LOG_TRIVIAL(debug)
#define infolog BOOST_LOG_TRIVIAL(info)
#define warnlog BOOST_LOG_TRIVIAL(warning)
#define errlog BOOST_LOG_TRIVIAL(error)
#define fatallog BOOST_LOG_TRIVIAL(fatal)


namespace cpca::logging
{
  /**
   * Translates a textual level name (trace, debug, info, warning,
   * error, fatal) into a boost log severity. Matching is case
   * insensitive. Throws std::invalid_argument on unknown names.
   */
  boost::log::trivial::severity_level parse_level(std::string const& name);

  /**
   * Installs a colored console sink on stderr. Stdout is reserved
   * for the JSON responses of the command line tool.
   *
   * Reads the optional "level" key from the "logging" config
   * section, defaults to "info".
   */
  void init(json_t const& config);
}
