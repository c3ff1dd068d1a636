#ifndef __SG_TEST_HEADERS__
#define __SG_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __SG_TEST_HEADERS__
