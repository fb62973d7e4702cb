#include "Client.hpp"

sp::Client::Client() {
  auto creds = grpc::InsecureChannelCredentials();
  channel = grpc::CreateChannel(Util::SERVICE_ADDR, creds);
  client = sp_pb::PService::NewStub(channel);
}

void sp::Client::run(Args &args) {
  if (args.help) {
    print_help(args.config.value);
    return;
  }

  if (!connected(1000)) {
    log_service_unavailable();
    return;
  }

  if (args.status) {
    status();
  } else if (args.thermals) {
    thermals();
  } else if (args.fans) {
    fans();
  } else if (args.fan_util) {
    fan_util();
  } else if (args.set_speed) {
    set_speed(args.set_speed.value);
  } else if (args.duty) {
    set_duty_cycle(args.duty.value);
  } else if (args.threshold) {
    set_threshold(args.threshold.value, args.critical);
  } else if (args.reload) {
    reload();
  } else if (args.stop_service) {
    stop_service();
  } else {
    print_help(args.config.value);
  }
}

void sp::Client::stop_service() {
  ClientContext context;
  if (check(client->StopService(&context, empty, &empty)))
    LOG(llvl::info) << "Service stopped";
  else
    LOG(llvl::error) << "Failed to stop service";
}

void sp::Client::reload() {
  ClientContext context;
  if (check(client->Reload(&context, empty, &empty)))
    LOG(llvl::info) << "Reloaded";
}

optional<sp_pb::ThermalStatusList> sp::Client::get_thermals() {
  ClientContext context;
  sp_pb::ThermalStatusList l;
  if (!check(client->GetThermals(&context, empty, &l)))
    return nullopt;

  return l;
}

optional<sp_pb::FanStatusList> sp::Client::get_fans() {
  ClientContext context;
  sp_pb::FanStatusList l;
  if (!check(client->GetFans(&context, empty, &l)))
    return nullopt;

  return l;
}

void sp::Client::status() {
  ClientContext context;
  sp_pb::Platform p;
  if (check(client->GetPlatform(&context, empty, &p)))
    cout << log::fmt_bold << p.name() << log::fmt_reset << endl;

  thermals();
  fans();
}

void sp::Client::thermals() {
  const auto l = get_thermals();
  if (!l || l->thermal_size() == 0) {
    LOG(llvl::info) << "No thermals found";
    return;
  }

  print(*l);
}

void sp::Client::fans() {
  const auto l = get_fans();
  if (!l || l->fan_size() == 0) {
    LOG(llvl::info) << "No fans found";
    return;
  }

  print(*l);
}

void sp::Client::fan_util() {
  ClientContext context;
  sp_pb::FanUtilStatus s;
  if (!check(client->GetFanUtil(&context, empty, &s)))
    return;

  cout << "Duty cycle: "
       << ((s.has_duty_cycle()) ? to_string(s.duty_cycle()) + "%" : "N/A")
       << endl;

  const auto opt_str = [](bool has, int val) {
    return (has) ? to_string(val) : string("N/A");
  };

  for (const auto &f : s.fan()) {
    cout << "fan" << f.num() << ": " << setw(8)
         << ((f.ok()) ? "ok" : "not ok") << "  present "
         << opt_str(f.has_present(), f.present()) << "  fault "
         << opt_str(f.has_fault(), f.fault()) << "  " << setw(5)
         << opt_str(f.has_front_rpm(), f.front_rpm()) << "rpm " << setw(5)
         << opt_str(f.has_rear_rpm(), f.rear_rpm()) << "rpm" << endl;
  }
}

void sp::Client::set_speed(const string &assignment) {
  const auto a = split_assignment(assignment);
  const string &speed_str = (a) ? a->second : assignment;
  const auto speed = Util::parse<int>(speed_str);
  if (!speed || *speed < 0) {
    LOG(llvl::error) << "Invalid speed: '" << speed_str << "'";
    return;
  }

  sp_pb::SpeedRequest req;
  if (a)
    req.set_name(a->first);
  req.set_speed(static_cast<uint>(*speed));

  ClientContext context;
  if (check(client->SetFanSpeed(&context, req, &empty)))
    LOG(llvl::info) << ((a) ? a->first : "All fans") << ": " << *speed << "%";
}

void sp::Client::set_duty_cycle(const string &percent) {
  const auto duty = Util::parse<int>(percent);
  if (!duty || *duty < 0) {
    LOG(llvl::error) << "Invalid duty cycle: '" << percent << "'";
    return;
  }

  sp_pb::DutyCycle req;
  req.set_percent(static_cast<uint>(*duty));

  ClientContext context;
  if (check(client->SetDutyCycle(&context, req, &empty)))
    LOG(llvl::info) << "Duty cycle: " << *duty << "%";
}

void sp::Client::set_threshold(const string &assignment, bool critical) {
  const auto a = split_assignment(assignment);
  const auto value = (a) ? Util::parse<double>(a->second) : nullopt;
  if (!value) {
    LOG(llvl::error) << "Expected <thermal>=<temperature>, got: '"
                     << assignment << "'";
    return;
  }

  sp_pb::ThresholdRequest req;
  req.set_name(a->first);
  req.set_field((critical) ? sp_pb::ThresholdRequest_Field_HIGH_CRITICAL
                           : sp_pb::ThresholdRequest_Field_HIGH);
  req.set_value(*value);

  ClientContext context;
  if (check(client->SetThreshold(&context, req, &empty)))
    LOG(llvl::info) << a->first << ": "
                    << ((critical) ? "high critical" : "high")
                    << " threshold " << *value;
}

void sp::Client::print_help(const string &conf) {
  LOG(llvl::info) << "swplat arg [value] ..." << endl
                  << "h  help                Show this help" << endl
                  << "s  status              Status of all thermals & fans"
                  << endl
                  << "t  thermals            Status of all thermals" << endl
                  << "f  fans                Status of all fans" << endl
                  << "u  fan-util            Fan CPLD nodes" << endl
                  << "   set-speed [fan=%]   Set the speed of the fan, or "
                  << "all fans without a name" << endl
                  << "   duty      [%]       Set the duty cycle of all fans"
                  << endl
                  << "   threshold [name=t]  Set the high threshold" << endl
                  << "   critical            Set the high critical threshold "
                  << "instead" << endl
                  << "r  reload              Reload the platform" << endl
                  << "c  config    [file]    Platform config path (default: "
                  << log::fmt_green_bold << conf << log::fmt_reset << ")"
                  << endl
                  << "p  platform  [name]    Built-in platform (default: "
                  << DEFAULT_PLATFORM << ")" << endl
                  << "   service             Start as service" << endl
                  << "d  daemon              Daemonize the process "
                  << "(default: false)" << endl
                  << "   stop-service        Stop the service" << endl
                  << "v  verbose             Debug logging level" << endl
                  << "a  trace               Trace logging level" << endl;
}

bool sp::Client::service_running() {
  auto creds = grpc::InsecureChannelCredentials();
  auto channel = grpc::CreateChannel(Util::SERVICE_ADDR, creds);
  channel->WaitForConnected(Util::deadline(200));
  return channel->GetState(true) == GRPC_CHANNEL_READY;
}

sp::Client::operator bool() const { return bool(client); }

bool sp::Client::connected(long timeout_ms) const {
  channel->WaitForConnected(Util::deadline(timeout_ms));
  return channel->GetState(true) == GRPC_CHANNEL_READY;
}

bool sp::Client::check(const grpc::Status &status) {
  if (status.ok())
    return true;

  switch (status.error_code()) {
  case StatusCode::UNAVAILABLE:
    log_service_unavailable();
    break;
  case StatusCode::NOT_FOUND:
    LOG(llvl::error) << status.error_message() << ": not found";
    break;
  case StatusCode::UNIMPLEMENTED:
    LOG(llvl::error) << "Not supported: " << status.error_message();
    break;
  default:
    LOG(llvl::error) << status.error_message();
  }

  return false;
}

void sp::Client::log_service_unavailable() {
  LOG(llvl::fatal) << "Unable to connect to service; " << endl
                   << log::fmt_bold << "start with 'sudo swplat --service'"
                   << log::fmt_reset;
}

void sp::Client::print(const sp_pb::ThermalStatusList &l) {
  size_t longest_name = 0;
  for (const auto &t : l.thermal())
    longest_name = std::max(longest_name, t.name().length());

  for (const auto &t : l.thermal()) {
    cout << std::left << setw(longest_name) << t.name() << std::right << ": "
         << setw(7) << ((t.status()) ? "ok" : "not ok") << " " << std::fixed
         << std::setprecision(1) << setw(6) << t.temperature() << "C  high "
         << threshold_text(t.has_high_threshold(), t.high_threshold())
         << "  crit "
         << threshold_text(t.has_high_critical_threshold(),
                           t.high_critical_threshold())
         << endl;
  }
}

void sp::Client::print(const sp_pb::FanStatusList &l) {
  size_t longest_name = 0;
  for (const auto &f : l.fan())
    longest_name = std::max(longest_name, f.name().length());

  for (const auto &f : l.fan()) {
    if (!f.presence()) {
      cout << std::left << setw(longest_name) << f.name() << std::right
           << ": " << setw(7) << "absent" << endl;
      continue;
    }

    cout << std::left << setw(longest_name) << f.name() << std::right << ": "
         << setw(7) << ((f.status()) ? "ok" : "not ok") << " " << setw(3)
         << f.speed() << "% (target " << setw(3) << f.target_speed() << "% +-"
         << f.speed_tolerance() << ") " << setw(7) << f.direction() << " "
         << f.led() << endl;
  }
}

string sp::Client::threshold_text(bool has, double value) {
  if (!has)
    return NOT_AVAILABLE;

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << value;
  return ss.str();
}
