#ifndef SWPLAT_FAN_HPP
#define SWPLAT_FAN_HPP

#include "fan/FanBase.hpp"
#include "proto/PlatformSpec.pb.h"

using Duty_to_Rpm_Map = std::map<Percent, Rpm>;

namespace sp {
inline const char *DEFAULT_TARGET_SPEED_PATH = "/tmp/fan_target_speed";

Duty_to_Rpm_Map target_speed_map(const sp_pb::Platform &p);
path i2c_device_path(const sp_pb::Platform &p, const sp_pb::I2CDevice &dev);

/// \brief
/// A chassis fan rotor (front or rear rotor of a fan tray) read through the
/// fan CPLD, or a PSU fan read through the PSU's hwmon & CPLD nodes
class Fan : public FanBase {
public:
  Fan(const sp_pb::Platform &p, uint fan_tray_index, uint fan_index = 0,
      bool is_psu_fan = false, uint psu_index = 0, bool host = true);

  const bool is_psu_fan;

  string get_name() const override;
  bool get_presence() const override;
  bool get_status() const override;
  int get_position_in_parent() const override;
  bool is_replaceable() const override;

  string get_direction() const override;
  Percent get_speed() const override;
  Percent get_target_speed() const override;
  Percent get_speed_tolerance() const override;
  bool set_speed(int speed) override;
  bool set_status_led(const string &color) override;
  string get_status_led() const override;

  void to(sp_pb::FanStatus &s) const;

private:
  uint tray_index, fan_index, psu_index;
  bool host;
  string name;
  path duty_path, present_path, direction_path, input_path, fault_path;
  path psu_rpm_path, psu_dir_path, psu_present_path, psu_power_good_path;
  path marker_path;
  Duty_to_Rpm_Map duty_to_rpm;
  Percent tolerance;
  Rpm psu_max_rpm;

  optional<Rpm> target_rpm(int duty) const;
  static path cpld_node(const sp_pb::Platform &p, uint num,
                        const string &suffix);
};
} // namespace sp

#endif // SWPLAT_FAN_HPP
