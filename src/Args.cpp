#include "Args.hpp"

sp::Arg::Arg(string name, string short_name, bool potential_value,
             bool needs_value, string value, bool triggered)
    : key(move(name)), short_key(move(short_name)), value(move(value)),
      triggered(triggered), potential_value(potential_value),
      needs_value(needs_value) {}

bool sp::Arg::has_value() const { return !value.empty(); }

sp::Arg::operator bool() const { return triggered; }

map<string, string> sp::Args::short_to_key() const {
  map<string, string> short_to_key;
  for (const auto &[key, a] : from_key) {
    if (!a.short_key.empty())
      short_to_key.insert_or_assign(a.short_key, a.key);
  }

  return short_to_key;
}

optional<std::reference_wrapper<sp::Arg>> sp::Args::find(string_view arg) {
  // Only "-x" & "--xyz" are arguments, anything else is a value
  if (arg.size() < 2 || arg.front() != '-')
    return nullopt;

  arg.remove_prefix((arg.size() > 2 && arg[1] == '-') ? 2 : 1);
  string key(arg);
  const auto short_keys = short_to_key();
  if (const auto it = short_keys.find(key); it != short_keys.end())
    key = it->second;

  const auto it = from_key.find(key);
  if (it == from_key.end())
    return nullopt;

  return std::ref(it->second);
}

optional<pair<string, string>> sp::split_assignment(const string &s) {
  const auto sep = s.rfind('=');
  if (sep == string::npos || sep == 0 || sep + 1 == s.size())
    return nullopt;

  string name = s.substr(0, sep), value = s.substr(sep + 1);
  boost::algorithm::trim(name);
  boost::algorithm::trim(value);
  return pair(move(name), move(value));
}
