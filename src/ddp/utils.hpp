#pragma once

/**
 * @defgroup ddp Ddp
 */

/**
 * @defgroup ddp-utils Utilities
 * @ingroup ddp
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/unique-id.hpp"
