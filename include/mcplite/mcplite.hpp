#pragma once

/// Umbrella header for the mcplite tool server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "logger.hpp"
#include "schema.hpp"
#include "type_traits.hpp"
#include "registry.hpp"
#include "tool.hpp"
#include "response.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
