#pragma once

#include <span>
#include <string>
#include <string_view>

/**
 * @defgroup cli Command Line Utils
 * @ingroup ddp-utils
 *
 * Helpers for walking `argc`/`argv` in a hand written argument loop.
 *
 * @see src/main.cpp for the `ddp-cli` argument loop
 */

namespace ddp::cli {
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
std::string safe_arg_choice(int argc, char** argv, int& i,
                            std::span<const std::string_view> choices);

} // namespace ddp::cli
