//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
