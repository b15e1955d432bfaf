#pragma once

// Precompiled header for every target in the project

#include "ddp/utils/base-include.hpp"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <variant>
