#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/interval.hpp"
#include "internal/util/time.hpp"

namespace booking::wire {

// Payload shape or value problems: missing keys, unknown action, bad dates.
class RequestError : public std::runtime_error {
 public:
  explicit RequestError(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline constexpr std::string_view kBookingTag      = "book";
inline constexpr std::string_view kAvailabilityTag = "avail";
inline constexpr std::string_view kIncidentTag     = "incid";

// ---------------------------------------------------------------------
// book
// ---------------------------------------------------------------------

struct CreateBooking {
  int64_t         user_id  = 0;
  int64_t         space_id = 0;
  util::TimePoint start{};
  util::TimePoint end{};
  std::string     reason;
};

struct DecideBooking {
  int64_t              booking_id = 0;
  model::IntervalState outcome    = model::IntervalState::kApproved;
  int64_t              admin_id   = 0;
};

struct CancelBooking {
  int64_t booking_id = 0;
  int64_t user_id    = 0;
};

struct ListUserBookings {
  int64_t user_id = 0;
};

// ---------------------------------------------------------------------
// avail
// ---------------------------------------------------------------------

struct CheckAvailability {
  util::Date                          date{};
  std::optional<std::chrono::minutes> time;
  std::optional<int>                  duration_hours;
  std::optional<std::string>          space_type;
};

struct GetCalendar {
  int64_t    space_id = 0;
  util::Date date{};
};

// ---------------------------------------------------------------------
// incid
// ---------------------------------------------------------------------

struct ReportIncident {
  int64_t                space_id = 0;
  std::string            type;
  std::string            description;
  std::optional<int64_t> reported_by;
};

struct ListIncidents {
  std::optional<model::IncidentStatus> status;
  std::optional<int64_t>               space_id;
};

struct ApplyBlock {
  int64_t         incident_id = 0;
  util::TimePoint start{};
  util::TimePoint end{};
};

struct ResolveIncident {
  int64_t     incident_id = 0;
  std::string solution;
};

using Request = std::variant<CreateBooking, DecideBooking, CancelBooking, ListUserBookings, CheckAvailability,
                             GetCalendar, ReportIncident, ListIncidents, ApplyBlock, ResolveIncident>;

/*
  Decodes a payload into exactly one operation of the service named by tag
  (untrimmed tags are accepted).

  An "accion" key names the operation outright. Without it the payload must
  match exactly one operation's key shape: every required key present and no
  key outside required and optional ones. No match and several matches are
  both RequestError.
*/
Request ParseRequest(std::string_view tag, const google::protobuf::Value& payload);

// Stable operation name for logs, e.g. "book.create".
std::string_view RouteName(const Request& request);

bool IsKnownService(std::string_view tag);

bool IsIncidentType(std::string_view type);

} // namespace booking::wire
