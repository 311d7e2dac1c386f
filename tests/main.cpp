// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
