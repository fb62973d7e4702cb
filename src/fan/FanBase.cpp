#include "FanBase.hpp"

#include <cmath>

Percent sp::clamp_percent(double percent) {
  if (!(percent > PERCENT_MIN))
    return PERCENT_MIN;
  if (percent > PERCENT_MAX)
    return PERCENT_MAX;

  return static_cast<Percent>(percent);
}
