#ifndef SWPLAT_UTIL_HPP
#define SWPLAT_UTIL_HPP

#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/algorithm/string/trim.hpp>
#include <google/protobuf/message.h>
#include <unistd.h>

#include "util/Logging.hpp"

namespace fs = std::filesystem;

using fs::exists;
using fs::path;
using std::cout;
using std::endl;
using std::from_chars;
using std::function;
using std::make_shared;
using std::make_unique;
using std::map;
using std::move;
using std::nullopt;
using std::optional;
using std::pair;
using std::runtime_error;
using std::shared_ptr;
using std::string;
using std::string_view;
using std::to_string;
using std::unique_ptr;
using std::vector;

namespace sp::Util {
static const string SERVICE_ADDR = "127.0.0.1:5821";

optional<path> resolve(const path &fpath);
optional<string> read_line(const path &fpath, bool failed = false);
template <typename T> optional<T> parse(string_view s);
template <typename T> optional<T> read(const path &fpath);
template <typename T>
bool write(const path &fpath, T val, bool create = false, bool failed = false);
template <typename K, typename T> string map_str(const std::map<K, T> &m);
string join(std::initializer_list<pair<bool, string>> args,
            string join_with = " & ");
bool is_root();
bool is_atty();
bool is_host();
std::chrono::system_clock::time_point deadline(long ms);
bool deep_equal(const google::protobuf::Message &m1,
                const google::protobuf::Message &m2);
} // namespace sp::Util

//----------------------//
// TEMPLATE DEFINITIONS //
//----------------------//

template <typename T> optional<T> sp::Util::parse(string_view s) {
  if constexpr (std::is_same_v<T, string>) {
    return string(s);
  } else {
    // sysfs integers may carry a sign, from_chars doesn't accept '+'
    if (!s.empty() && s.front() == '+')
      s.remove_prefix(1);

    T val{};
    const char *end = s.data() + s.size();
    const auto [ptr, ec] = from_chars(s.data(), end, val);
    if (ec != std::errc() || ptr != end)
      return nullopt;

    return val;
  }
}

template <typename T> optional<T> sp::Util::read(const path &fpath) {
  const auto line = read_line(fpath);
  if (!line)
    return nullopt;

  const auto val = parse<T>(*line);
  if (!val)
    LOG(llvl::debug) << "Failed to parse '" << *line << "' from: " << fpath;

  return val;
}

template <typename T>
bool sp::Util::write(const path &fpath, T val, bool create, bool failed) {
  const path p = resolve(fpath).value_or(fpath);
  if (!create && !exists(p)) {
    LOG(llvl::error) << "Failed to write file, doesn't exist: " << p;
    return false;
  }

  std::ofstream ofs(p.string());
  if (!ofs) {
    LOG(llvl::error) << "Failed to write file, can't open: " << p;
    return false;
  }

  ofs << val;
  ofs.close();

  if (!ofs) {
    if (!failed)
      return write(p, move(val), create, true);

    LOG(llvl::error) << "Failed to write '" << val << "' to: " << p;
    return false;
  }

  return true;
}

template <typename K, typename T>
string sp::Util::map_str(const std::map<K, T> &m) {
  std::stringstream ss;
  for (auto it = m.begin(); it != m.end();) {
    ss << it->first << ": " << it->second;
    if (++it != m.end())
      ss << ", ";
  }
  return ss.str();
}

#endif // SWPLAT_UTIL_HPP
