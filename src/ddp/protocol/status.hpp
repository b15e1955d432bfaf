#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ddp {

enum class StatusCode : int8_t {
  OK = 0,
  METHOD_ERROR,       //!< A `result` frame carried an `error`
  SUBSCRIPTION_ERROR, //!< A `nosub` frame carried an `error`
  CANCELLED           //!< A `nosub` frame without an `error`: the server ended the subscription
};

constexpr std::string_view str(StatusCode code) {
  switch (code) {
  case StatusCode::OK:
    return "OK";
  case StatusCode::METHOD_ERROR:
    return "METHOD_ERROR";
  case StatusCode::SUBSCRIPTION_ERROR:
    return "SUBSCRIPTION_ERROR";
  case StatusCode::CANCELLED:
    return "CANCELLED";
  }
  return "<unknown case>";
}

/**
 * @brief The outcome of a method call or subscription, as reported by the server.
 *
 * + `error` is the `error` field of the server's error object. Numeric codes
 *   (e.g. 404) are rendered as text.
 * + `reason` is the human readable `reason`.
 * + `details` is the `details` field: plain text if the server sent a string,
 *   otherwise the raw JSON.
 */
class Status {
private:
  std::string error_{};
  std::string reason_{};
  std::string details_{};
  StatusCode status_code_{StatusCode::OK};

public:
  Status(StatusCode status_code = StatusCode::OK, std::string error = "", std::string reason = "",
         std::string details = "")
      : error_{std::move(error)}, reason_{std::move(reason)}, details_{std::move(details)},
        status_code_{status_code} {}

  StatusCode code() const { return status_code_; }
  std::string_view error() const { return error_; }
  std::string_view reason() const { return reason_; }
  std::string_view details() const { return details_; }
  bool ok() const { return status_code_ == StatusCode::OK; }

  bool operator==(const Status& o) const {
    return (status_code_ == o.status_code_) && (error_ == o.error_) && (reason_ == o.reason_) &&
           (details_ == o.details_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

} // namespace ddp
