#pragma once

/// Umbrella header for the mcpconn MCP connection manager.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framing.hpp"
#include "session.hpp"
#include "process.hpp"
#include "client.hpp"
#include "connection.hpp"
#include "registry.hpp"
#include "service.hpp"
#include "transport/transport.hpp"
#include "transport/pipe_transport.hpp"
