#pragma once

// Core types
#include "core/types.hpp"
#include "core/uuid.hpp"
#include "core/config.hpp"

// Network
#include "net/http_client.hpp"
#include "net/http_server.hpp"
#include "net/sse_parser.hpp"

// Research backend
#include "backend/agent_event.hpp"
#include "backend/event_decoder.hpp"
#include "backend/tool_call_assembler.hpp"
#include "backend/stream_client.hpp"
#include "backend/agent_registry.hpp"

// Turn state
#include "session/stream_session.hpp"
#include "session/turn_controller.hpp"
#include "session/session_store.hpp"

// Caller-facing output
#include "emit/delta_emitter.hpp"
#include "emit/turn_accumulator.hpp"

// Front-end server
#include "server/chat_router.hpp"
#include "bridge/bridge.hpp"
