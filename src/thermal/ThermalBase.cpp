#include "ThermalBase.hpp"

Temp sp::ThermalBase::get_temperature() {
  const auto temp = read();
  if (!temp) {
    LOG(llvl::debug) << *this << ": temperature unavailable";
    return 0;
  }

  const std::lock_guard<std::mutex> lock(record_mutex);
  if (!min_recorded || *temp < *min_recorded)
    min_recorded = temp;
  if (!max_recorded || *temp > *max_recorded)
    max_recorded = temp;

  LOG(llvl::trace) << *this << ": " << *temp << "°" << sp::log::flush;

  return *temp;
}

Temp sp::ThermalBase::get_low_threshold() const {
  throw NotImplementedError(get_name() + ": low threshold not supported");
}

Temp sp::ThermalBase::get_low_critical_threshold() const {
  throw NotImplementedError(get_name() +
                            ": low critical threshold not supported");
}

bool sp::ThermalBase::set_low_threshold([[maybe_unused]] Temp temp) {
  return false;
}

bool sp::ThermalBase::set_low_critical_threshold([[maybe_unused]] Temp temp) {
  return false;
}

optional<Temp> sp::ThermalBase::get_minimum_recorded() const {
  const std::lock_guard<std::mutex> lock(record_mutex);
  return min_recorded;
}

optional<Temp> sp::ThermalBase::get_maximum_recorded() const {
  const std::lock_guard<std::mutex> lock(record_mutex);
  return max_recorded;
}
