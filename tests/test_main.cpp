// Tracemark (MIT License) - See LICENSE file
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
