#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup ddp-utils
 *
 * Errors that the client reports through `DdpListener::on_exception`, and that
 * the codec returns through `expected<T, error_code>`.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The server sent something we could not parse
 * return make_unexpected(make_error_code(ecode::malformed_frame));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace ddp {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of ddp error codes.
 */
enum class ecode : int {
  okay = 0,            //!< i.e., everything's okay.
  malformed_frame,     //!< Inbound payload is not a JSON object, or a field has the wrong type.
  unsupported_version, //!< The server insists on a protocol version we do not speak.
  transport_error,     //!< The transport failed to connect, read, or write.
  not_connected,       //!< An operation needed a live transport.
  server_error,        //!< The server rejected one of our frames (`msg: "error"`).
  invalid_url,         //!< The server address is not a `ws://` or `wss://` url.
  reconnect_exhausted  //!< Gave up after the maximum number of reconnect attempts.
};
} // namespace ddp

namespace std {
template <> struct is_error_code_enum<ddp::ecode> : true_type {};
} // namespace std

namespace ddp {
error_code make_error_code(ecode);
const std::error_category& ddp_category() noexcept;
} // namespace ddp
