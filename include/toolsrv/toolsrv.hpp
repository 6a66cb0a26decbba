#pragma once

/// Umbrella header for the toolsrv library.

#include "version.hpp"
#include "error.hpp"
#include "config.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "method.hpp"
#include "session.hpp"
#include "router.hpp"
#include "schema.hpp"
#include "tool_registry.hpp"
#include "executor.hpp"
#include "shutdown.hpp"
#include "server.hpp"
#include "tools/text_tools.hpp"
#include "tools/weather.hpp"
#include "tools/catalog.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
