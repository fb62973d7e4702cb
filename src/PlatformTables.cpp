#include "Platform.hpp"

namespace {
struct ThermalRow {
  const char *name;
  sp_pb::ThermalKind kind;
  double high, high_critical;
};

struct PsuRow {
  uint hwmon_bus;
  const char *hwmon_addr;
  uint cpld_bus;
  const char *cpld_addr;
};

// Edgecore AS7926-40XFB
const ThermalRow as7926_40xfb_thermals[] = {
    {"Temp sensor 1", sp_pb::BOARD, 84.0, 87.0},
    {"Temp sensor 2", sp_pb::BOARD, 110.0, 115.0},
    {"Temp sensor 3", sp_pb::BOARD, 110.0, 115.0},
    {"Temp sensor 4", sp_pb::BOARD, 70.0, 73.0},
    {"Temp sensor 5", sp_pb::BOARD, 72.0, 75.0},
    {"Temp sensor 6", sp_pb::BOARD, 73.0, 76.0},
    {"Temp sensor 7", sp_pb::BOARD, 70.0, 73.0},
    {"Temp sensor 8", sp_pb::BOARD, 62.0, 65.0},
    {"Temp sensor 9", sp_pb::BOARD, 84.0, 87.0},
    {"Temp sensor 10", sp_pb::BOARD, 76.0, 79.0},
    {"CPU Package Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 0 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 1 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 2 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 3 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 4 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 5 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 6 Temp", sp_pb::CPU, 82.0, 104.0},
    {"CPU Core 7 Temp", sp_pb::CPU, 82.0, 104.0},
};

const ThermalRow as7926_40xfb_psu_thermals[] = {
    {"PSU-1 temp sensor 1", sp_pb::PSU, 62.0, 67.0},
    {"PSU-2 temp sensor 1", sp_pb::PSU, 62.0, 67.0},
};

// Edgecore AS9736-64D
const char *as9736_64d_fan_names[] = {"FAN-1F", "FAN-1R", "FAN-2F", "FAN-2R",
                                      "FAN-3F", "FAN-3R", "FAN-4F", "FAN-4R"};

const PsuRow as9736_64d_psus[] = {{41, "59", 41, "51"}, {33, "58", 33, "50"}};

const uint as9736_64d_rpm_per_percent = 136;

void add_thermal(sp_pb::Platform &p, const ThermalRow &row,
                 uint psu_index = 0) {
  auto &t = *p.add_thermal();
  t.set_name(row.name);
  t.set_kind(row.kind);
  t.set_high_threshold(row.high);
  t.set_high_critical_threshold(row.high_critical);
  t.set_psu_index(psu_index);
}

sp_pb::Platform as7926_40xfb() {
  sp_pb::Platform p;
  p.set_name("as7926-40xfb");
  p.set_thermal_path("/sys/devices/platform/as7926_40xfb_thermal");
  p.set_psu_thermal_path("/sys/devices/platform/as7926_40xfb_psu");
  for (const auto &row : as7926_40xfb_thermals)
    add_thermal(p, row);

  uint psu_index = 0;
  for (const auto &row : as7926_40xfb_psu_thermals)
    add_thermal(p, row, psu_index++);

  p.set_threshold_path(sp::DEFAULT_THRESHOLD_PATH);
  return p;
}

sp_pb::Platform as9736_64d() {
  sp_pb::Platform p;
  p.set_name("as9736-64d");
  p.set_fan_cpld_prefix("/sys/bus/i2c/devices/25-0033/fan");
  p.set_fan_trays(4);
  for (const char *n : as9736_64d_fan_names)
    p.add_fan_name(n);
  p.set_rear_fan_offset(10);

  p.set_i2c_root("/sys/bus/i2c/devices");
  for (const auto &row : as9736_64d_psus) {
    auto &psu = *p.add_psu();
    psu.mutable_hwmon()->set_bus(row.hwmon_bus);
    psu.mutable_hwmon()->set_addr(row.hwmon_addr);
    psu.mutable_cpld()->set_bus(row.cpld_bus);
    psu.mutable_cpld()->set_addr(row.cpld_addr);
  }
  p.set_psu_fans(1);
  p.set_psu_fan_max_rpm(26688);

  for (uint duty = 0; duty <= 100; duty += 5) {
    auto &ts = *p.add_target_speed();
    ts.set_duty(duty);
    ts.set_rpm(duty * as9736_64d_rpm_per_percent);
  }
  p.set_speed_tolerance(30);

  p.set_target_speed_path(sp::DEFAULT_TARGET_SPEED_PATH);
  p.set_threshold_path(sp::DEFAULT_THRESHOLD_PATH);
  p.set_fan_util_path("/sys/bus/i2c/devices/25-0033");
  p.set_fan_util_fans(4);
  p.set_monitor_container("pmon");
  return p;
}

const map<string, sp_pb::Platform (*)()> builtins = {
    {"as7926-40xfb", &as7926_40xfb}, {"as9736-64d", &as9736_64d}};
} // namespace

optional<sp_pb::Platform> sp::Platform::builtin(const string &name) {
  const auto it = builtins.find(name);
  if (it == builtins.end())
    return nullopt;

  return it->second();
}

vector<string> sp::Platform::builtin_names() {
  vector<string> names;
  for (const auto &[name, f] : builtins)
    names.push_back(name);
  return names;
}
