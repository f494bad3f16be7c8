#include "tracescope/conversation/pair.hpp"

#include "tracescope/common/time.hpp"

#include <algorithm>

namespace tracescope::conversation {

double clamp_response_time(const common::Timestamp user_time,
                           const common::Timestamp assistant_time) {
  const double seconds = common::seconds_between(user_time, assistant_time);
  return std::clamp(seconds, 0.0, MAX_RESPONSE_TIME_SECONDS);
}

} // namespace tracescope::conversation
