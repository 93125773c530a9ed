#pragma once

// Tunnel client exposing a local HTTP service through a websocket relay.

#include "backoff.hpp"
#include "channel.hpp"
#include "error.hpp"
#include "forwarder.hpp"
#include "handshake.hpp"
#include "heartbeat.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "options.hpp"
#include "protocol.hpp"
#include "run_control.hpp"
#include "stream.hpp"
#include "tunnel_client.hpp"
#include "uri.hpp"
