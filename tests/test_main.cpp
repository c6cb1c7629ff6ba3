// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN.
// Every other test file includes doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
