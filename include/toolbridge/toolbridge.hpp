#pragma once

/// Umbrella header for the toolbridge tool-server client runtime.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framing.hpp"
#include "schema.hpp"
#include "config.hpp"
#include "backoff.hpp"
#include "pending_table.hpp"
#include "router.hpp"
#include "connector.hpp"
#include "session.hpp"
#include "client.hpp"
#include "task.hpp"
#include "transport/transport.hpp"
#include "transport/stream_transport.hpp"
#include "transport/process_transport.hpp"
#include "transport/socket_transport.hpp"
#include "transport/http_transport.hpp"
#include "transport/factory.hpp"
