// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "log.h"
#include "json.h"

#include <iomanip>
#include <iostream>
#include <stdexcept>

#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

namespace cpca::logging
{

namespace logging = boost::log;
namespace attrs = boost::log::attributes;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

using severity_level = boost::log::trivial::severity_level;

static void coloring_formatter(
  boost::log::record_view const& rec, 
  boost::log::formatting_ostream& strm)
{
  auto severity = rec[boost::log::trivial::severity];
  if (severity)
  {
      switch (severity.get())
      {
      case severity_level::trace:
          strm << "\033[38;5;242m"; break;
      case severity_level::debug:
          strm << "\033[38;5;246m"; break;
      case severity_level::info:
          strm << "\033[32m"; break;
      case severity_level::warning:
          strm << "\033[33m"; break;
      case severity_level::error:
      case severity_level::fatal:
          strm << "\033[31m"; break;
      default:
          break;
      }
  }
  strm << logging::extract<boost::posix_time::ptime>("ts", rec) << " | "
       << std::setw(7) << rec[logging::trivial::severity] << " | "
       << logging::extract<attrs::current_thread_id::value_type>("tid", rec) << " | "
       << rec[expr::smessage];
  if (severity) {
      strm << "\033[0m";
  }
}

severity_level parse_level(std::string const& name)
{
  if (boost::iequals(name, "trace")) {
    return severity_level::trace;
  } else if (boost::iequals(name, "debug")) {
    return severity_level::debug;
  } else if (boost::iequals(name, "info")) {
    return severity_level::info;
  } else if (boost::iequals(name, "warning") || boost::iequals(name, "warn")) {
    return severity_level::warning;
  } else if (boost::iequals(name, "error")) {
    return severity_level::error;
  } else if (boost::iequals(name, "fatal")) {
    return severity_level::fatal;
  } else {
    throw std::invalid_argument("unrecognized logging level: " + name);
  }
}

void init(json_t const& config)
{
  using backend_t = sinks::text_ostream_backend;
  using sink_t = sinks::synchronous_sink<backend_t>;

  auto level = parse_level(config.get<std::string>("level", "info"));

  auto backend = boost::make_shared<backend_t>();
  backend->add_stream(boost::shared_ptr<std::ostream>(
    &std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<sink_t>(backend);
  sink->set_formatter(&coloring_formatter);

  auto core = logging::core::get();
  core->add_sink(sink);
  core->set_filter(logging::trivial::severity >= level);
  
  core->add_global_attribute("ts", attrs::local_clock());
  core->add_global_attribute("tid", attrs::current_thread_id());
}

}
