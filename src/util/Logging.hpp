#ifndef SWPLAT_LOGGING_HPP
#define SWPLAT_LOGGING_HPP

#ifndef SWPLAT_LOCALSTATEDIR
#define SWPLAT_LOCALSTATEDIR "/var"
#endif // SWPLAT_LOCALSTATEDIR

#include <boost/log/attributes/clock.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <iostream> // cout, cerr
#include <optional>
#include <string>
#include <vector>

using llvl = boost::log::trivial::severity_level;
using logger_t = boost::log::sources::severity_logger_mt<llvl>;

// Declare a global logger with a custom initialization
BOOST_LOG_GLOBAL_LOGGER(logger, logger_t)

#define LOG(lvl) BOOST_LOG_SEV(logger::get(), lvl)

namespace sp {
bool debugging();
bool is_systemd();

namespace log {
extern llvl logging_level;
extern const char *fmt_reset, *fmt_bold, *fmt_red, *fmt_green_bold;

std::vector<boost::shared_ptr<boost::log::sinks::sink>> generate_sinks();
std::ostream &flush(std::ostream &os);
/// The core filter reads the level on every record
void set_level(const llvl log_level);
} // namespace log
} // namespace sp

#endif // SWPLAT_LOGGING_HPP
