#include "internal/util/time.hpp"

namespace migrate::util {

TimePoint Now() {
  return Clock::now();
}

bsoncxx::types::b_date ToBsonDate(TimePoint tp) {
  return bsoncxx::types::b_date{std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch())};
}

} // namespace migrate::util
