#include "Logging.hpp"

#include <charconv>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

using namespace boost::log;
namespace expr = boost::log::expressions;

namespace sp::log {
llvl logging_level = llvl::info;
const char *fmt_reset = "\033[0m", *fmt_bold = "\033[1m",
           *fmt_red = "\033[31m", *fmt_green_bold = "\033[1;32m";
} // namespace sp::log

namespace {
using sink_ptr = boost::shared_ptr<sinks::sink>;

constexpr const char *LOG_FILE = SWPLAT_LOCALSTATEDIR "/log/swplat.log";
constexpr auto LOG_FILE_MAX_SIZE = 512 * 1024;

struct ConsoleSink {
  std::ostream &os;
  filter severity_filter;
  bool decorated;
  bool red;
};

formatter make_formatter(bool systemd, bool red) {
  const auto severity =
      expr::attr<llvl>(aux::default_attribute_names::severity());
  const char *start = (red) ? sp::log::fmt_red : "",
             *end = (red) ? sp::log::fmt_reset : "";

  // journald stamps the time & pid itself
  if (systemd)
    return expr::stream << start << severity << ": " << expr::smessage << end;

  return expr::stream << start
                      << expr::format_date_time<boost::posix_time::ptime>(
                             aux::default_attribute_names::timestamp(),
                             "%Y-%m-%d %H:%M:%S")
                      << " swplat[" << getpid() << "] " << severity << ": "
                      << expr::smessage << end;
}

sink_ptr file_sink() {
  try {
    auto f = add_file_log(keywords::file_name = LOG_FILE,
                          keywords::open_mode = std::ios_base::app,
                          keywords::max_size = LOG_FILE_MAX_SIZE,
                          keywords::max_files = 1);
    f->set_filter(trivial::severity != llvl::info);
    f->set_formatter(make_formatter(false, false));
    return f;
  } catch (const std::exception &e) {
    std::cerr << "Failed to open " << LOG_FILE << ": " << e.what()
              << std::endl;
    return nullptr;
  }
}

template <typename T> std::optional<T> parse_id(std::string_view s) {
  T id{};
  const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
  if (ec != std::errc() || end != s.data() + s.size())
    return std::nullopt;

  return id;
}
} // namespace

std::vector<sink_ptr> sp::log::generate_sinks() {
  const bool systemd = is_systemd();
  const bool red = !systemd && isatty(STDERR_FILENO);

  // Info is what the CLI prints, so it goes out undecorated
  const ConsoleSink consoles[] = {
      {std::cout, trivial::severity < llvl::info, true, false},
      {std::cout, trivial::severity == llvl::info, false, false},
      {std::cerr, trivial::severity > llvl::info, true, red},
  };

  std::vector<sink_ptr> sinks_;
  for (const auto &c : consoles) {
    auto s = add_console_log(c.os, keywords::auto_flush = true);
    s->set_filter(c.severity_filter);
    if (c.decorated)
      s->set_formatter(make_formatter(systemd, c.red));
    sinks_.emplace_back(std::move(s));
  }

  // Root daemons outside systemd keep a log file, the journal does otherwise
  if (getuid() == 0 && !systemd) {
    if (auto f = file_sink(); f)
      sinks_.emplace_back(std::move(f));
  }

  return sinks_;
}

std::ostream &sp::log::flush(std::ostream &os) {
  core::get()->flush();
  return os;
}

BOOST_LOG_GLOBAL_LOGGER_INIT(logger, logger_t) {
  const auto c = core::get();
  c->add_global_attribute(aux::default_attribute_names::timestamp(),
                          attributes::local_clock());
  for (auto &s : sp::log::generate_sinks())
    c->add_sink(s);
  c->set_filter(trivial::severity >= boost::ref(sp::log::logging_level));

  return logger_t();
}

void sp::log::set_level(const llvl log_level) { logging_level = log_level; }

bool sp::debugging() { return sp::log::logging_level <= llvl::debug; }

bool sp::is_systemd() {
  // JOURNAL_STREAM is "<device>:<inode>" of the stream stderr was given
  const char *env = getenv("JOURNAL_STREAM");
  if (!env)
    return false;

  const std::string_view js(env);
  const auto sep = js.find(':');
  if (sep == std::string_view::npos)
    return false;

  const auto dev = parse_id<dev_t>(js.substr(0, sep));
  const auto ino = parse_id<ino_t>(js.substr(sep + 1));
  struct stat s;
  if (!dev || !ino || fstat(STDERR_FILENO, &s) != 0)
    return false;

  return s.st_dev == *dev && s.st_ino == *ino;
}
