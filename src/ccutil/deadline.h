/**********************************************************************
 * File:        deadline.h
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

#ifndef TESSPIPE_CCUTIL_DEADLINE_H_
#define TESSPIPE_CCUTIL_DEADLINE_H_

#include <tesspipe/export.h>

#include <chrono>
#include <cstdint>

namespace tesspipe {

class TESSPIPE_API Deadline {
public:
  // No deadline: never exceeded.
  Deadline();

  // Non-positive, non-finite or multi-year timeouts give no deadline.
  static Deadline FromSeconds(double seconds);

  // Sets the end time to be deadline_msecs milliseconds from now. Any
  // `deadline_msecs` value <= 0, or too large to represent as a
  // steady_clock time point, disables the deadline.
  void set_deadline_msecs(int64_t deadline_msecs);

  bool has_deadline() const;

  // Returns false if we've not passed the end_time, or have not set a deadline.
  bool deadline_exceeded() const;

  // Milliseconds until the deadline, clamped to [0, INT32_MAX]; -1 when
  // there is no deadline (the poll(2) convention for "wait forever").
  int remaining_msecs() const;

private:
  std::chrono::steady_clock::time_point end_time_;
};

} // namespace tesspipe

#endif // TESSPIPE_CCUTIL_DEADLINE_H_
