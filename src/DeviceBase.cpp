#include "DeviceBase.hpp"

std::ostream &sp::operator<<(std::ostream &os, const sp::DeviceBase &d) {
  return os << d.get_name();
}
