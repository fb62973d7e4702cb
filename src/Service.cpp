#include "Service.hpp"

sp::Service::Service(path config_path_, string platform_name_, bool daemon)
    : config_path(move(config_path_)), platform_name(move(platform_name_)) {
  if (daemon)
    daemonize();

  reload();
  if (!platform)
    throw runtime_error("Failed to load platform: " + platform_name);

  if (!config_path.empty())
    watcher = spawn_watcher();
}

sp::Service::~Service() {
  if (watcher) {
    watcher->interrupt();
    if (watcher->joinable())
      watcher->join();
  }
  shutdown();
}

void sp::Service::run() {
  try {
    auto creds = grpc::InsecureServerCredentials();
    ServerBuilder builder;
    server = builder.AddListeningPort(SERVICE_ADDR, creds)
                 .RegisterService(this)
                 .BuildAndStart();

    if (!server) {
      LOG(llvl::fatal) << "Failed to listen on " << SERVICE_ADDR;
      return;
    }

    {
      const shared_lock lock(platform_mutex);
      LOG(llvl::info) << "Serving " << platform->name() << " on "
                      << SERVICE_ADDR;
    }
    server->Wait();
  } catch (std::exception &e) {
    LOG(llvl::fatal) << e.what();
    throw;
  }
}

void sp::Service::shutdown() {
  if (server)
    server->Shutdown(Util::deadline(250));
}

bool sp::Service::reload() {
  const unique_lock lock(platform_mutex);
  auto p = Platform::load(config_path, platform_name);
  if (!p) {
    if (platform)
      LOG(llvl::error) << "Failed to reload platform, keeping "
                       << platform->name();
    return false;
  }

  if (platform) {
    sp_pb::Platform current;
    platform->to(current);
    if (Util::deep_equal(current, *p)) {
      LOG(llvl::debug) << "Platform unchanged";
      return true;
    }
  }

  platform = make_unique<Platform>(*p);
  LOG(llvl::info) << "Loaded platform: " << platform->name();
  return true;
}

Status sp::Service::StopService([[maybe_unused]] ServerContext *context,
                                [[maybe_unused]] const Empty *e,
                                [[maybe_unused]] Empty *resp) {
  boost::thread([this] { shutdown(); }).detach();
  return Status::OK;
}

Status sp::Service::Reload([[maybe_unused]] ServerContext *context,
                           [[maybe_unused]] const Empty *e,
                           [[maybe_unused]] Empty *resp) {
  if (!reload())
    return Status(StatusCode::FAILED_PRECONDITION, "Failed to load platform");

  return Status::OK;
}

Status sp::Service::GetPlatform([[maybe_unused]] ServerContext *context,
                                [[maybe_unused]] const Empty *e,
                                sp_pb::Platform *resp) {
  const shared_lock lock(platform_mutex);
  platform->to(*resp);
  return Status::OK;
}

Status sp::Service::GetThermals([[maybe_unused]] ServerContext *context,
                                [[maybe_unused]] const Empty *e,
                                sp_pb::ThermalStatusList *resp) {
  const shared_lock lock(platform_mutex);
  for (const auto &t : platform->thermals)
    t->to(*resp->add_thermal());

  return Status::OK;
}

Status sp::Service::GetFans([[maybe_unused]] ServerContext *context,
                            [[maybe_unused]] const Empty *e,
                            sp_pb::FanStatusList *resp) {
  const shared_lock lock(platform_mutex);
  for (const auto &f : platform->fans)
    f->to(*resp->add_fan());

  return Status::OK;
}

Status sp::Service::GetFanStatus([[maybe_unused]] ServerContext *context,
                                 const sp_pb::DeviceName *n,
                                 sp_pb::FanStatus *resp) {
  const shared_lock lock(platform_mutex);
  const Fan *f = platform->find_fan(n->name());
  if (!f)
    return Status(StatusCode::NOT_FOUND, n->name());

  f->to(*resp);
  return Status::OK;
}

Status sp::Service::SetFanSpeed([[maybe_unused]] ServerContext *context,
                                const sp_pb::SpeedRequest *req,
                                [[maybe_unused]] Empty *resp) {
  if (req->speed() > PERCENT_MAX)
    return Status(StatusCode::INVALID_ARGUMENT,
                  "Speed must be within " + to_string(PERCENT_MIN) + "-" +
                      to_string(PERCENT_MAX) + "%");

  const shared_lock lock(platform_mutex);
  const int speed = static_cast<int>(req->speed());
  if (!req->name().empty()) {
    Fan *f = platform->find_fan(req->name());
    if (!f)
      return Status(StatusCode::NOT_FOUND, req->name());

    if (!f->set_speed(speed))
      return Status(StatusCode::FAILED_PRECONDITION,
                    "Failed to set speed of " + req->name());

    LOG(llvl::info) << *f << ": speed set to " << speed << "%";
    return Status::OK;
  }

  vector<string> failed;
  for (const auto &f : platform->fans) {
    if (f->is_psu_fan)
      continue;
    if (!f->set_speed(speed))
      failed.push_back(f->get_name());
  }

  if (!failed.empty()) {
    std::stringstream ss;
    ss << "Failed to set speed of:";
    for (const auto &name : failed)
      ss << ' ' << name;
    return Status(StatusCode::FAILED_PRECONDITION, ss.str());
  }

  LOG(llvl::info) << "All fans set to " << speed << "%";
  return Status::OK;
}

Status sp::Service::SetThreshold([[maybe_unused]] ServerContext *context,
                                 const sp_pb::ThresholdRequest *req,
                                 [[maybe_unused]] Empty *resp) {
  const shared_lock lock(platform_mutex);
  Thermal *t = platform->find_thermal(req->name());
  if (!t)
    return Status(StatusCode::NOT_FOUND, req->name());

  const bool critical =
      req->field() == sp_pb::ThresholdRequest_Field_HIGH_CRITICAL;
  const bool valid = (critical)
                         ? t->valid_high_critical_threshold(req->value())
                         : t->valid_high_threshold(req->value());
  if (!valid)
    return Status(StatusCode::INVALID_ARGUMENT,
                  "Invalid threshold for " + req->name());

  const bool set = (critical) ? t->set_high_critical_threshold(req->value())
                              : t->set_high_threshold(req->value());
  if (!set)
    return Status(StatusCode::FAILED_PRECONDITION,
                  "Failed to save threshold for " + req->name());

  LOG(llvl::info) << *t << ": " << ((critical) ? "high critical" : "high")
                  << " threshold set to " << req->value();
  return Status::OK;
}

Status sp::Service::GetFanUtil([[maybe_unused]] ServerContext *context,
                               [[maybe_unused]] const Empty *e,
                               sp_pb::FanUtilStatus *resp) {
  const shared_lock lock(platform_mutex);
  if (!platform->fan_util)
    return Status(StatusCode::UNIMPLEMENTED,
                  platform->name() + " has no fan CPLD");

  platform->fan_util->to(*resp);
  return Status::OK;
}

Status sp::Service::SetDutyCycle([[maybe_unused]] ServerContext *context,
                                 const sp_pb::DutyCycle *req,
                                 [[maybe_unused]] Empty *resp) {
  if (req->percent() > PERCENT_MAX)
    return Status(StatusCode::INVALID_ARGUMENT,
                  "Duty cycle must be within " + to_string(PERCENT_MIN) +
                      "-" + to_string(PERCENT_MAX) + "%");

  const shared_lock lock(platform_mutex);
  if (!platform->fan_util)
    return Status(StatusCode::UNIMPLEMENTED,
                  platform->name() + " has no fan CPLD");

  if (!platform->fan_util->set_fan_duty_cycle(
          static_cast<int>(req->percent())))
    return Status(StatusCode::FAILED_PRECONDITION,
                  "Failed to set duty cycle");

  LOG(llvl::info) << "Duty cycle set to " << req->percent() << "%";
  return Status::OK;
}

boost::thread sp::Service::spawn_watcher() {
  return boost::thread([this] {
    if (exists(config_path))
      config_write_time = fs::last_write_time(config_path);

    for (; true; boost::this_thread::sleep_for(watch_interval)) {
      if (config_file_modified()) {
        config_write_time = fs::last_write_time(config_path);
        LOG(llvl::info) << "Config changed: " << config_path;
        reload();
      }
    }
  });
}

bool sp::Service::config_file_modified() {
  std::error_code ec;
  const auto write_time = fs::last_write_time(config_path, ec);
  if (ec)
    return false;

  return config_write_time != write_time;
}

void sp::Service::daemonize() {
  const auto fork_thread = []() {
    pid_t pid = fork();

    // On success: child's PID is returned in parent, 0 returned in child
    if (pid > 0)
      exit(EXIT_SUCCESS);
    else if (pid == -1) {
      LOG(llvl::fatal) << "Failed to fork off parent";
      exit(EXIT_FAILURE);
    }
  };

  // Fork, start a new session, then fork again so the daemon can't acquire a
  // controlling terminal
  fork_thread();

  if (setsid() < 0) {
    LOG(llvl::fatal) << "Failed to create new session";
    exit(EXIT_FAILURE);
  }

  fork_thread();

  const char *dnull = "/dev/null";
  stdin = fopen(dnull, "r");
  stdout = fopen(dnull, "r+");
  stderr = fopen(dnull, "r+");

  umask(002);

  if (chdir("/") < 0)
    LOG(llvl::error) << "Failed to set working directory to '/'";
}
