#ifndef SWPLAT_FANUTIL_HPP
#define SWPLAT_FANUTIL_HPP

#include <pstreams/pstream.h>

#include "fan/FanBase.hpp"
#include "proto/PlatformSpec.pb.h"

namespace sp {
enum FanNode : uint {
  FAN_NODE_FAULT = 1,
  FAN_NODE_DUTY = 2,
  FAN_NODE_FRONT_SPEED = 3,
  FAN_NODE_REAR_SPEED = 4,
  FAN_NODE_PRESENT = 5,
};

/// \brief
/// Direct access to the fan CPLD nodes, used by the fan control process.
/// Fans are numbered from 1; nodes are FanNode values.
class FanUtil {
public:
  explicit FanUtil(const sp_pb::Platform &p, bool host = true);

  static constexpr uint FAN_NUM_START = 1, NODE_NUM_START = FAN_NODE_FAULT,
                        NODE_NUM = FAN_NODE_PRESENT;

  uint get_num_fans() const;
  uint get_idx_fan_start() const;
  uint get_num_nodes() const;
  uint get_idx_node_start() const;
  size_t get_size_node_map() const;
  size_t get_size_path_map() const;
  optional<path> get_fan_device_path(uint fan_num, uint node_num) const;

  optional<int> get_fan_fault(uint fan_num) const;
  optional<int> get_fan_present(uint fan_num) const;
  optional<int> get_fan_front_speed(uint fan_num) const;
  optional<int> get_fan_rear_speed(uint fan_num) const;
  optional<bool> get_fan_status(uint fan_num) const;
  optional<int> get_fan_duty_cycle() const;
  bool set_fan_duty_cycle(int val);

  void to(sp_pb::FanUtilStatus &s) const;

private:
  uint num_fans;
  bool host;
  path marker_path;
  string monitor_container;
  map<pair<uint, uint>, string> node_map;
  map<pair<uint, uint>, path> path_map;

  bool valid(uint fan_num, uint node_num) const;
  optional<int> get_fan_node_val(uint fan_num, uint node_num) const;
  bool set_fan_node_val(uint fan_num, uint node_num, int val) const;
  void mirror_to_container(int val) const;
};
} // namespace sp

#endif // SWPLAT_FANUTIL_HPP
