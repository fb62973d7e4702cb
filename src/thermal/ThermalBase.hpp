#ifndef SWPLAT_THERMALBASE_HPP
#define SWPLAT_THERMALBASE_HPP

#include <mutex>

#include "DeviceBase.hpp"

using Temp = double;

namespace sp {
class ThermalBase : public DeviceBase {
public:
  ThermalBase() = default;

  /// \return degrees Celsius, 0 when the sensor can't be read
  Temp get_temperature();

  virtual Temp get_high_threshold() const = 0;
  virtual Temp get_high_critical_threshold() const = 0;
  virtual bool set_high_threshold(Temp temp) = 0;
  virtual bool set_high_critical_threshold(Temp temp) = 0;

  virtual Temp get_low_threshold() const;
  virtual Temp get_low_critical_threshold() const;
  virtual bool set_low_threshold(Temp temp);
  virtual bool set_low_critical_threshold(Temp temp);

  optional<Temp> get_minimum_recorded() const;
  optional<Temp> get_maximum_recorded() const;

protected:
  virtual optional<Temp> read() const = 0;

private:
  mutable std::mutex record_mutex;
  optional<Temp> min_recorded, max_recorded;
};
} // namespace sp

#endif // SWPLAT_THERMALBASE_HPP
