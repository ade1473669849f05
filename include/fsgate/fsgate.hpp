#pragma once

/// Umbrella header for the fsgate filesystem gateway library.

#include "version.hpp"
#include "error.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "sanitizer.hpp"
#include "path_normalizer.hpp"
#include "path_security.hpp"
#include "encoding.hpp"
#include "fs_types.hpp"
#include "filesystem_ops.hpp"
#include "script_executor.hpp"
#include "tool_catalog.hpp"
#include "router.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
