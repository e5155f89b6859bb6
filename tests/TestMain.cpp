//
//  File:       TestMain.cpp
//
//  Function:   Test runner
//
//  Copyright:  Andrew Willmott 2018
//

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
