#include "main.hpp"

int main(int argc, char *argv[]) {
  using namespace sp;

  Args args;
  read_args(argc, argv, args);

  if (args.trace || args.verbose)
    log::set_level((args.trace) ? llvl::trace : llvl::debug);
  else
    log::set_level(llvl::info);

  // SERVICE
  if (args.service) {
    if (!is_root()) {
      LOG(llvl::fatal) << "Service must be run as root";
      return EXIT_FAILURE;
    }

    if (Client::service_running()) {
      LOG(llvl::fatal) << "Only 1 instance may be run";
      return EXIT_SUCCESS;
    }

    try {
      sp::Service service(config_path(args), args.platform.value,
                          args.daemon);
      register_signal_handler();
      if (!is_systemd())
        LOG(llvl::info) << "Service started";
      service.run();
    } catch (const std::exception &e) {
      LOG(llvl::fatal) << e.what();
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

  // CLIENT
  if (is_root() && !sp::is_systemd())
    LOG(llvl::warning) << "Running the client as root is not recommended";

  Client client;
  client.run(args);

  return EXIT_SUCCESS;
}

Args &sp::read_args(int argc, char *argv[], Args &args) {
  for (int i = 1; i < argc; ++i) {
    const auto found = args.find(argv[i]);
    if (!found) {
      LOG(llvl::error) << "Unknown argument: '" << argv[i] << "'";
      continue;
    }

    Arg &arg = found->get();
    arg.triggered = true;

    if (arg.potential_value) {
      // The next argument is the value, unless it's an argument itself
      if ((i + 1) < argc && !args.find(argv[i + 1])) {
        arg.value = argv[i + 1];
        i += 1;
      } else if (arg.needs_value && !arg.has_value()) {
        arg.triggered = false;
        LOG(llvl::error) << "Arg '" << arg.key << "' needs a value";
      }
    }
  }

  if (sp::debugging())
    print_args(args);

  return args;
}

void sp::print_args(Args &args) {
  std::stringstream ss;
  ss << "Started with arguments: [";
  for (auto it = args.from_key.begin(); it != args.from_key.end();) {
    ss << it->second.key << ": " << it->second.triggered
       << (!it->second.value.empty() ? (" (" + it->second.value + ")") : "")
       << ((++it != args.from_key.end()) ? ", " : "]");
  }
  cout << ss.str() << endl;
}

path sp::config_path(const Args &args) {
  // A platform named explicitly overrides the default config file
  if (args.platform && !args.config)
    return path();

  return path(args.config.value);
}

void sp::signal_handler(int signal) {
  switch (signal) {
  case SIGINT:
  case SIGQUIT:
  case SIGTERM:
    Client().stop_service();
    break;
  default:
    LOG(llvl::warning) << "Unhandled signal (" << signal
                       << "): " << strsignal(signal);
  }
}

void sp::register_signal_handler() {
  for (const auto &s : {SIGINT, SIGQUIT, SIGTERM, SIGUSR1})
    std::signal(s, &sp::signal_handler);
}
