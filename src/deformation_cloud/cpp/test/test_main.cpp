/**
 * @file test_main.cpp
 * @brief Catch2 entry point shared by the test executables
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
