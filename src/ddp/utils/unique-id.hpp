#pragma once

#include <string>

namespace ddp {

/**
 * @ingroup ddp-utils
 * @brief A fresh random (version 4) uuid in canonical text form,
 *        e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427".
 * @note Threadsafe; each thread owns its generator.
 */
std::string unique_id();

} // namespace ddp
