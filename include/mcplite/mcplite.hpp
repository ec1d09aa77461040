#pragma once

/// Umbrella header for the mcplite line-delimited MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool_registry.hpp"
#include "dispatcher.hpp"
#include "demo_tools.hpp"
#include "logging.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
