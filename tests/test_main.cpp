#define BOOST_TEST_MODULE txproof Test Suite

#include "log.hpp"

#include <boost/test/unit_test.hpp>

// Keep test output readable; failures still surface through Boost.Test
struct QuietLogging {
    QuietLogging() { txproof::Log::set_level(txproof::LogLevel::Error); }
};

BOOST_TEST_GLOBAL_FIXTURE(QuietLogging);
