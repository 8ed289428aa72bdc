#pragma once

/// Umbrella header for the clinmcp tool server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framing.hpp"
#include "session.hpp"
#include "router.hpp"
#include "tool.hpp"
#include "docstring.hpp"
#include "registry.hpp"
#include "discovery.hpp"
#include "dispatcher.hpp"
#include "resources.hpp"
#include "server.hpp"
#include "rest_adapter.hpp"
#include "config.hpp"
#include "catalog.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
