#ifndef SWPLAT_THERMAL_HPP
#define SWPLAT_THERMAL_HPP

#include "ThresholdStore.hpp"
#include "proto/PlatformSpec.pb.h"
#include "thermal/ThermalBase.hpp"

using sp_pb::ThermalKind;

namespace sp {
inline const Temp SYSFS_TEMP_DIVISOR = 1000;

// https://www.kernel.org/doc/Documentation/hwmon/sysfs-interface
class Thermal : public ThermalBase {
public:
  Thermal(sp_pb::ThermalSpec spec_, const path &sysfs_dir,
          shared_ptr<ThresholdStore> store_ = nullptr);

  string get_name() const override;
  bool get_presence() const override;
  bool get_status() const override;
  int get_position_in_parent() const override;
  bool is_replaceable() const override;

  Temp get_high_threshold() const override;
  Temp get_high_critical_threshold() const override;
  bool set_high_threshold(Temp temp) override;
  bool set_high_critical_threshold(Temp temp) override;

  /// \brief
  /// Finite and no higher than the default, the store isn't consulted
  bool valid_high_threshold(Temp temp) const;
  bool valid_high_critical_threshold(Temp temp) const;

  ThermalKind kind() const;
  const path &get_input_path() const { return input_path; }

  void to(sp_pb::ThermalStatus &s);

protected:
  optional<Temp> read() const override;

private:
  sp_pb::ThermalSpec spec;
  path input_path, present_path;
  shared_ptr<ThresholdStore> store;

  bool valid_threshold(Temp temp, optional<Temp> default_temp,
                       const char *field) const;
  bool has_store() const;
  static path input_path_of(const sp_pb::ThermalSpec &spec, const path &dir);
};
} // namespace sp

#endif // SWPLAT_THERMAL_HPP
