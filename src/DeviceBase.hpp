#ifndef SWPLAT_DEVICEBASE_HPP
#define SWPLAT_DEVICEBASE_HPP

#include <stdexcept>

#include "util/Util.hpp"

namespace sp {
inline const string NOT_AVAILABLE = "N/A";

class NotImplementedError : public runtime_error {
public:
  using runtime_error::runtime_error;
};

// Common part of every field replaceable unit exposed to the platform API
class DeviceBase {
public:
  DeviceBase() = default;
  virtual ~DeviceBase() = default;

  virtual string get_name() const = 0;
  virtual bool get_presence() const = 0;
  virtual string get_model() const { return NOT_AVAILABLE; }
  virtual string get_serial() const { return NOT_AVAILABLE; }
  virtual bool get_status() const = 0;

  /// \return 1-based position in the parent device, -1 if unknown
  virtual int get_position_in_parent() const = 0;
  virtual bool is_replaceable() const = 0;

  friend std::ostream &operator<<(std::ostream &os, const DeviceBase &d);
};

std::ostream &operator<<(std::ostream &os, const DeviceBase &d);
} // namespace sp

#endif // SWPLAT_DEVICEBASE_HPP
