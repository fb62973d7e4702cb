#ifndef SWPLAT_FANBASE_HPP
#define SWPLAT_FANBASE_HPP

#include "DeviceBase.hpp"

using Percent = uint;
using Rpm = uint;

namespace sp {
const Percent PERCENT_MIN = 0, PERCENT_MAX = 100;

inline const string FAN_DIRECTION_INTAKE = "intake",
                    FAN_DIRECTION_EXHAUST = "exhaust",
                    FAN_DIRECTION_NOT_APPLICABLE = NOT_AVAILABLE;

inline const string STATUS_LED_COLOR_GREEN = "green",
                    STATUS_LED_COLOR_AMBER = "amber",
                    STATUS_LED_COLOR_RED = "red",
                    STATUS_LED_COLOR_OFF = "off";

Percent clamp_percent(double percent);

class FanBase : public DeviceBase {
public:
  FanBase() = default;

  virtual string get_direction() const = 0;
  virtual Percent get_speed() const = 0;
  virtual Percent get_target_speed() const = 0;
  virtual Percent get_speed_tolerance() const = 0;
  virtual bool set_speed(int speed) = 0;
  virtual bool set_status_led(const string &color) = 0;
  virtual string get_status_led() const = 0;
};
} // namespace sp

#endif // SWPLAT_FANBASE_HPP
