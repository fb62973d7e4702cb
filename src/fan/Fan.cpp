#include "Fan.hpp"

#include <cmath>

Duty_to_Rpm_Map sp::target_speed_map(const sp_pb::Platform &p) {
  Duty_to_Rpm_Map m;
  for (const auto &ts : p.target_speed())
    m.insert_or_assign(ts.duty(), ts.rpm());
  return m;
}

path sp::i2c_device_path(const sp_pb::Platform &p,
                         const sp_pb::I2CDevice &dev) {
  return path(p.i2c_root()) / (to_string(dev.bus()) + "-00" + dev.addr());
}

sp::Fan::Fan(const sp_pb::Platform &p, uint fan_tray_index, uint fan_index_,
             bool is_psu_fan_, uint psu_index_, bool host_)
    : is_psu_fan(is_psu_fan_), tray_index(fan_tray_index),
      fan_index(fan_index_), psu_index(psu_index_), host(host_),
      marker_path(p.target_speed_path().empty() ? DEFAULT_TARGET_SPEED_PATH
                                                : p.target_speed_path()),
      duty_to_rpm(target_speed_map(p)), tolerance(p.speed_tolerance()),
      psu_max_rpm(p.psu_fan_max_rpm()) {
  if (is_psu_fan) {
    if (psu_index >= static_cast<uint>(p.psu_size()))
      throw runtime_error("PSU " + to_string(psu_index + 1) +
                          " isn't described by platform " + p.name());

    const path hwmon = i2c_device_path(p, p.psu(psu_index).hwmon()),
               cpld = i2c_device_path(p, p.psu(psu_index).cpld());
    psu_rpm_path = hwmon / "psu_fan1_speed_rpm";
    psu_dir_path = hwmon / "psu_fan_dir";
    psu_present_path = cpld / "psu_present";
    psu_power_good_path = cpld / "psu_power_good";
    name = "PSU-" + to_string(psu_index + 1) + " FAN-" +
           to_string(fan_index + 1);
    return;
  }

  if (tray_index >= p.fan_trays())
    throw runtime_error("Fan tray " + to_string(tray_index + 1) +
                        " isn't described by platform " + p.name());

  // Front rotors are numbered from 1, rear rotors from 1 + rear_fan_offset
  const uint tray_num = tray_index + 1,
             rotor_num = tray_num + ((fan_index == 0) ? 0 : p.rear_fan_offset());
  duty_path = cpld_node(p, tray_num, "_duty_cycle_percentage");
  present_path = cpld_node(p, tray_num, "_present");
  direction_path = cpld_node(p, tray_num, "_direction");
  input_path = cpld_node(p, rotor_num, "_input");
  fault_path = cpld_node(p, rotor_num, "_fault");

  const int rotors = p.fan_name_size() / static_cast<int>(p.fan_trays()),
            name_i = static_cast<int>(tray_index) * rotors +
                     static_cast<int>(fan_index);
  if (fan_index < static_cast<uint>(rotors) && name_i < p.fan_name_size())
    name = p.fan_name(name_i);
  else
    name = "FAN-" + to_string(tray_num) + ((fan_index == 0) ? "F" : "R");
}

string sp::Fan::get_name() const { return name; }

bool sp::Fan::get_presence() const {
  const path &p = (is_psu_fan) ? psu_present_path : present_path;
  return Util::read<int>(p).value_or(0) == 1;
}

bool sp::Fan::get_status() const {
  if (is_psu_fan)
    return Util::read<int>(psu_power_good_path).value_or(0) == 1;

  const auto fault = Util::read<int>(fault_path);
  return fault && *fault == 0;
}

int sp::Fan::get_position_in_parent() const {
  return static_cast<int>((is_psu_fan) ? psu_index + 1 : fan_index + 1);
}

bool sp::Fan::is_replaceable() const { return !is_psu_fan; }

string sp::Fan::get_direction() const {
  if (!is_psu_fan) {
    // 0: F2B
    const auto dir = Util::read_line(direction_path);
    if (!dir)
      return FAN_DIRECTION_EXHAUST;

    return (*dir == "0") ? FAN_DIRECTION_EXHAUST : FAN_DIRECTION_INTAKE;
  }

  // A PSU without power doesn't report its fan direction
  if (Util::read<int>(psu_power_good_path).value_or(0) == 0)
    return FAN_DIRECTION_NOT_APPLICABLE;

  const auto dir = Util::read_line(psu_dir_path);
  if (!dir || *dir == "F2B")
    return FAN_DIRECTION_EXHAUST;

  return FAN_DIRECTION_INTAKE;
}

Percent sp::Fan::get_speed() const {
  if (is_psu_fan) {
    const auto rpm = Util::read<Rpm>(psu_rpm_path);
    if (!rpm || psu_max_rpm == 0)
      return 0;

    return clamp_percent(*rpm * 100.0 / psu_max_rpm);
  }

  if (!get_presence())
    return 0;

  const auto duty = Util::read<int>(duty_path);
  const auto rpm = Util::read<int>(input_path);
  if (!duty || !rpm)
    return 0;

  const auto target = target_rpm(*duty);
  if (!target || *target == 0 || *rpm == 0)
    return 0;

  return clamp_percent(*duty * (static_cast<double>(*rpm) / *target));
}

Percent sp::Fan::get_target_speed() const {
  if (is_psu_fan)
    return get_speed();

  if (!get_presence())
    return 0;

  // Inside the monitor container the marker holds the last commanded speed
  const bool use_marker = !host && exists(marker_path);
  const auto speed = Util::read<int>((use_marker) ? marker_path : duty_path);
  if (!speed)
    return 0;

  return clamp_percent(*speed);
}

Percent sp::Fan::get_speed_tolerance() const {
  if (is_psu_fan || !exists(marker_path))
    return tolerance;

  const auto duty = Util::read<int>(duty_path),
             commanded = Util::read<int>(marker_path);
  if (!duty || !commanded)
    return tolerance;

  return tolerance + static_cast<Percent>(std::abs(*duty - *commanded));
}

bool sp::Fan::set_speed(int speed) {
  if (is_psu_fan) {
    LOG(llvl::debug) << *this << ": speed control not supported";
    return false;
  }

  if (speed < static_cast<int>(PERCENT_MIN) ||
      speed > static_cast<int>(PERCENT_MAX)) {
    LOG(llvl::error) << *this << ": invalid speed " << speed << "%";
    return false;
  }

  if (!get_presence()) {
    LOG(llvl::warning) << *this << ": not present, can't set speed";
    return false;
  }

  if (!Util::write(duty_path, speed))
    return false;

  if (!Util::write(marker_path, speed, true)) {
    LOG(llvl::error) << *this << ": failed to update " << marker_path;
    return false;
  }

  LOG(llvl::debug) << *this << ": speed set to " << speed << "%";
  return true;
}

bool sp::Fan::set_status_led([[maybe_unused]] const string &color) {
  return false;
}

string sp::Fan::get_status_led() const {
  const bool present = get_presence();
  if (!is_psu_fan)
    return (present) ? STATUS_LED_COLOR_GREEN : STATUS_LED_COLOR_AMBER;

  if (!present)
    return STATUS_LED_COLOR_OFF;

  return (get_status()) ? STATUS_LED_COLOR_GREEN : STATUS_LED_COLOR_AMBER;
}

void sp::Fan::to(sp_pb::FanStatus &s) const {
  s.set_name(get_name());
  s.set_presence(get_presence());
  s.set_status(get_status());
  s.set_direction(get_direction());
  s.set_speed(get_speed());
  s.set_target_speed(get_target_speed());
  s.set_speed_tolerance(get_speed_tolerance());
  s.set_led(get_status_led());
  s.set_position(get_position_in_parent());
  s.set_replaceable(is_replaceable());
  s.set_psu_fan(is_psu_fan);
}

optional<Rpm> sp::Fan::target_rpm(int duty) const {
  const auto it = duty_to_rpm.find(static_cast<Percent>(duty));
  if (duty < 0 || it == duty_to_rpm.end()) {
    LOG(llvl::warning) << *this << ": no target rpm for " << duty << "% duty";
    return nullopt;
  }

  return it->second;
}

path sp::Fan::cpld_node(const sp_pb::Platform &p, uint num,
                        const string &suffix) {
  return p.fan_cpld_prefix() + to_string(num) + suffix;
}
