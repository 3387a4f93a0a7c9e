// Always-on checks for the example test drivers
#pragma once

#include <cmath>
#include <cstdlib>
#include <iostream>

#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

#define REQUIRE_NEAR(a, b, tol, msg) REQUIRE(std::fabs((a) - (b)) <= (tol), msg << " (" << (a) << " vs " << (b) << ")")
