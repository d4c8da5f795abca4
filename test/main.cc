// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

int main(int argc, char* argv[])
{
  // keep test output readable, the parser logs every parse at trace
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= boost::log::trivial::warning);
  return Catch::Session().run(argc, argv);
}
