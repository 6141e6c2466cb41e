/**********************************************************************
 * File:        deadline.cpp
 * Description: Wall-clock deadline used to bound engine invocations.
 *
 ** Licensed under the Apache License, Version 2.0 (the "License");
 ** you may not use this file except in compliance with the License.
 ** You may obtain a copy of the License at
 ** http://www.apache.org/licenses/LICENSE-2.0
 ** Unless required by applicable law or agreed to in writing, software
 ** distributed under the License is distributed on an "AS IS" BASIS,
 ** WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 ** See the License for the specific language governing permissions and
 ** limitations under the License.
 *
 **********************************************************************/

#include "deadline.h"

#include <algorithm> // for std::min
#include <climits> // for INT_MAX
#include <cstdint> // for INT64_C
#include <cmath>   // for std::ceil, std::isfinite

namespace tesspipe {

// About three years. Longer timeouts mean "no deadline"; this keeps
// now() + timeout well inside steady_clock's range.
constexpr int64_t kMaxDeadlineMsecs = INT64_C(100000000000);

Deadline::Deadline() : end_time_() {}

Deadline Deadline::FromSeconds(double seconds) {
  Deadline d;
  if (seconds > 0 && std::isfinite(seconds) && seconds * 1000.0 < kMaxDeadlineMsecs) {
    // round up so that tiny positive timeouts still yield a real deadline
    d.set_deadline_msecs(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
  }
  return d;
}

void Deadline::set_deadline_msecs(int64_t deadline_msecs) {
  if (deadline_msecs > 0 && deadline_msecs <= kMaxDeadlineMsecs) {
    end_time_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(deadline_msecs);
  } else {
    end_time_ = std::chrono::steady_clock::time_point();
  }
}

bool Deadline::has_deadline() const {
  return end_time_.time_since_epoch() > std::chrono::steady_clock::duration::zero();
}

bool Deadline::deadline_exceeded() const {
  if (!has_deadline()) {
    return false;
  }
  return std::chrono::steady_clock::now() >= end_time_;
}

int Deadline::remaining_msecs() const {
  if (!has_deadline()) {
    return -1;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      end_time_ - std::chrono::steady_clock::now()).count();
  if (left <= 0) {
    return 0;
  }
  // poll() truncates; add one so we never wake up just short of the deadline
  return static_cast<int>(std::min<int64_t>(left + 1, INT_MAX));
}

} // namespace tesspipe
