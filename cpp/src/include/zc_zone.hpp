#pragma once
/**
 * @file zc_zone.hpp
 * @brief Layer 3: the zone discovery and session protocol.
 *
 * Include this to embed a zonechat client: SessionManager on top of a
 * ChannelTransport (ZmqTransport or LocalTransport) driven by an EventLoop.
 */
#include "zc_service.hpp"

#include "utils/zmq_context.hpp"
#include "zone/access_control.hpp"
#include "zone/channel_transport.hpp"
#include "zone/client_config.hpp"
#include "zone/clock.hpp"
#include "zone/collaborators.hpp"
#include "zone/discovery_service.hpp"
#include "zone/envelope.hpp"
#include "zone/event_loop.hpp"
#include "zone/geo.hpp"
#include "zone/history_sync.hpp"
#include "zone/local_bus.hpp"
#include "zone/presence_counter.hpp"
#include "zone/session_manager.hpp"
#include "zone/topics.hpp"
#include "zone/types.hpp"
#include "zone/typing_tracker.hpp"
#include "zone/zmq_transport.hpp"
