#pragma once

#include "client/ddp-client.hpp"
#include "client/ddp-listener.hpp"

#include "net/websocket-transport.hpp"
