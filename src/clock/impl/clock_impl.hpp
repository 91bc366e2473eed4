/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace rollkit::clock {

  template <typename ClockType>
  class ClockImpl : virtual public Clock<ClockType> {
   public:
    typename Clock<ClockType>::TimePoint now() const override;
    std::chrono::milliseconds nowMsec() const override;
  };

  class SystemClockImpl : public SystemClock,
                          public ClockImpl<std::chrono::system_clock> {};

}  // namespace rollkit::clock
