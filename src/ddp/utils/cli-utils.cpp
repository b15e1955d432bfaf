#include "cli-utils.hpp"

#include "base-include.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <limits>
#include <stdexcept>

namespace ddp::cli {
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const std::string_view arg = argv[i];
  ++i;
  if (i >= argc)
    throw std::runtime_error(format("expected string after argument '{}'", arg));
  return std::string{argv[i]};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument after `i` as a (possibly negative) integer.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const std::string_view arg = argv[i];
  ++i;
  auto badness = (i >= argc);
  auto ret = 0;

  if (!badness) {
    char* end = nullptr;
    const auto long_ret = std::strtol(argv[i], &end, 10);
    if (end == argv[i] || *end != '\0' || long_ret > std::numeric_limits<int>::max() ||
        long_ret < std::numeric_limits<int>::lowest())
      badness = true;
    else
      ret = static_cast<int>(long_ret);
  }

  if (badness)
    throw std::runtime_error(format("expected integer after argument '{}'", arg));

  return ret;
}

// ------------------------------------------------------------- safe-arg-choice
/**
 * @ingroup cli
 * @brief Get the argument after `i`, which must be one of `choices`.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`, or the argument is not a choice.
 */
std::string safe_arg_choice(int argc, char** argv, int& i,
                            std::span<const std::string_view> choices) {
  const std::string_view arg = argv[i];
  auto value = safe_arg_str(argc, argv, i);
  if (ranges::find(choices, std::string_view{value}) == choices.end())
    throw std::runtime_error(format(
        "unexpected value '{}' after argument '{}', expected one of: {}",
        value, arg, fmt::join(choices, ", ")));
  return value;
}

} // namespace ddp::cli
