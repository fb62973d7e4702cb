#include "FanUtil.hpp"

#include <sys/wait.h>

#include "fan/Fan.hpp"

namespace {
const map<uint, string> node_suffix = {
    {sp::FAN_NODE_FAULT, "_fault"},
    {sp::FAN_NODE_DUTY, "_duty_cycle_percentage"},
    {sp::FAN_NODE_FRONT_SPEED, "_front_speed_rpm"},
    {sp::FAN_NODE_REAR_SPEED, "_rear_speed_rpm"},
    {sp::FAN_NODE_PRESENT, "_present"}};
} // namespace

sp::FanUtil::FanUtil(const sp_pb::Platform &p, bool host_)
    : num_fans(p.fan_util_fans()), host(host_),
      marker_path(p.target_speed_path().empty() ? DEFAULT_TARGET_SPEED_PATH
                                                : p.target_speed_path()),
      monitor_container(p.monitor_container()) {
  const path base(p.fan_util_path());
  for (uint fan_num = FAN_NUM_START; fan_num < FAN_NUM_START + num_fans;
       ++fan_num) {
    for (const auto &[node_num, suffix] : node_suffix) {
      string node = "fan" + to_string(fan_num) + suffix;
      path_map.emplace(pair(fan_num, node_num), base / node);
      node_map.emplace(pair(fan_num, node_num), move(node));
    }
  }
}

uint sp::FanUtil::get_num_fans() const { return num_fans; }

uint sp::FanUtil::get_idx_fan_start() const { return FAN_NUM_START; }

uint sp::FanUtil::get_num_nodes() const { return NODE_NUM; }

uint sp::FanUtil::get_idx_node_start() const { return NODE_NUM_START; }

size_t sp::FanUtil::get_size_node_map() const { return node_map.size(); }

size_t sp::FanUtil::get_size_path_map() const { return path_map.size(); }

optional<path> sp::FanUtil::get_fan_device_path(uint fan_num,
                                                uint node_num) const {
  const auto it = path_map.find(pair(fan_num, node_num));
  return (it != path_map.end()) ? optional(it->second) : nullopt;
}

optional<int> sp::FanUtil::get_fan_fault(uint fan_num) const {
  return get_fan_node_val(fan_num, FAN_NODE_FAULT);
}

optional<int> sp::FanUtil::get_fan_present(uint fan_num) const {
  return get_fan_node_val(fan_num, FAN_NODE_PRESENT);
}

optional<int> sp::FanUtil::get_fan_front_speed(uint fan_num) const {
  return get_fan_node_val(fan_num, FAN_NODE_FRONT_SPEED);
}

optional<int> sp::FanUtil::get_fan_rear_speed(uint fan_num) const {
  return get_fan_node_val(fan_num, FAN_NODE_REAR_SPEED);
}

optional<bool> sp::FanUtil::get_fan_status(uint fan_num) const {
  if (!valid(fan_num, FAN_NODE_FAULT))
    return nullopt;

  if (const auto fault = get_fan_fault(fan_num); fault && *fault > 0) {
    LOG(llvl::debug) << "Fan " << fan_num << ": fault";
    return false;
  }

  return true;
}

optional<int> sp::FanUtil::get_fan_duty_cycle() const {
  // All fans share a duty cycle, the first fan's node represents them
  return get_fan_node_val(FAN_NUM_START, FAN_NODE_DUTY);
}

bool sp::FanUtil::set_fan_duty_cycle(int val) {
  if (val < static_cast<int>(PERCENT_MIN) ||
      val > static_cast<int>(PERCENT_MAX)) {
    LOG(llvl::error) << "Invalid duty cycle: " << val << "%";
    return false;
  }

  for (uint fan_num = FAN_NUM_START; fan_num < FAN_NUM_START + num_fans;
       ++fan_num) {
    if (!set_fan_node_val(fan_num, FAN_NODE_DUTY, val)) {
      LOG(llvl::error) << "Fan " << fan_num << ": failed to set duty cycle";
      return false;
    }
  }

  // Let the monitor know the commanded speed
  if (!Util::write(marker_path, val, true))
    return false;

  if (host && !monitor_container.empty())
    mirror_to_container(val);

  LOG(llvl::debug) << "Duty cycle set to " << val << "%";
  return true;
}

void sp::FanUtil::to(sp_pb::FanUtilStatus &s) const {
  if (const auto duty = get_fan_duty_cycle(); duty)
    s.set_duty_cycle(*duty);

  for (uint fan_num = FAN_NUM_START; fan_num < FAN_NUM_START + num_fans;
       ++fan_num) {
    auto &f = *s.add_fan();
    f.set_num(fan_num);
    if (const auto v = get_fan_fault(fan_num); v)
      f.set_fault(*v);
    if (const auto v = get_fan_present(fan_num); v)
      f.set_present(*v);
    if (const auto v = get_fan_front_speed(fan_num); v)
      f.set_front_rpm(*v);
    if (const auto v = get_fan_rear_speed(fan_num); v)
      f.set_rear_rpm(*v);
    f.set_ok(get_fan_status(fan_num).value_or(false));
  }
}

bool sp::FanUtil::valid(uint fan_num, uint node_num) const {
  if (fan_num < FAN_NUM_START || fan_num >= FAN_NUM_START + num_fans) {
    LOG(llvl::debug) << "Parameter error, fan_num: " << fan_num;
    return false;
  }

  if (node_num < NODE_NUM_START || node_num > NODE_NUM) {
    LOG(llvl::debug) << "Parameter error, node_num: " << node_num;
    return false;
  }

  return true;
}

optional<int> sp::FanUtil::get_fan_node_val(uint fan_num,
                                            uint node_num) const {
  if (!valid(fan_num, node_num))
    return nullopt;

  return Util::read<int>(path_map.at(pair(fan_num, node_num)));
}

bool sp::FanUtil::set_fan_node_val(uint fan_num, uint node_num,
                                   int val) const {
  if (!valid(fan_num, node_num))
    return false;

  return Util::write(path_map.at(pair(fan_num, node_num)), val);
}

void sp::FanUtil::mirror_to_container(int val) const {
  const string command = "docker exec " + monitor_container +
                         " bash -c 'echo " + to_string(val) + " > " +
                         marker_path.string() + "'";
  redi::ipstream ips(command,
                     redi::pstreams::pstdout | redi::pstreams::pstderr);
  for (string l; std::getline(ips, l);)
    LOG(llvl::debug) << monitor_container << ": " << l;
  ips.close();

  const int status = ips.rdbuf()->status();
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    LOG(llvl::warning) << "Failed to update the target speed in "
                       << monitor_container;
}
