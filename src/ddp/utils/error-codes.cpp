#include "error-codes.hpp"

#include <string>

namespace ddp {
namespace {
/**
 * @private
 */
struct ECodeCategory : std::error_category {
  const char* name() const noexcept override;
  std::string message(int ev) const override;
};

/**
 * @private
 */
const char* ECodeCategory::name() const noexcept { return "ddp"; }

/**
 * @private
 */
std::string ECodeCategory::message(int e) const {
  switch (static_cast<ecode>(e)) {
  case ecode::okay:
    return "okay";
  case ecode::malformed_frame:
    return "malformed frame";
  case ecode::unsupported_version:
    return "unsupported protocol version";
  case ecode::transport_error:
    return "transport error";
  case ecode::not_connected:
    return "not connected";
  case ecode::server_error:
    return "server error";
  case ecode::invalid_url:
    return "invalid url";
  case ecode::reconnect_exhausted:
    return "reconnect attempts exhausted";
  }
  return "(unknown error)";
}

/**
 * @private
 */
static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief The category of every `ecode`.
 */
const std::error_category& ddp_category() noexcept { return ecode_category; }

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace ddp
