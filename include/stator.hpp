#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/** \file stator.hpp
 * A convenience header to include stator core.
 */

#include "stator/actor_base.h"
#include "stator/address.hpp"
#include "stator/bus.h"
#include "stator/envelope.h"
#include "stator/registry.h"
#include "stator/router.h"
#include "stator/supervisor.h"
#include "stator/supervisor_tree.h"
#include "stator/system_context.h"

/// Basic namespace for all stator functionalities
namespace stator {}
