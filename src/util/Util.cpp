#include "Util.hpp"

#include <glob.h>

optional<path> sp::Util::resolve(const path &fpath) {
  const string &pattern = fpath.native();
  if (pattern.find_first_of("*?[") == string::npos)
    return fpath;

  // Driver enumeration order isn't stable (hwmon0 vs hwmon3), take the first
  // sorted match
  glob_t g{};
  const int ret = glob(pattern.c_str(), 0, nullptr, &g);
  optional<path> match;
  if (ret == 0 && g.gl_pathc > 0)
    match = path(g.gl_pathv[0]);
  else
    LOG(llvl::debug) << "No match for: " << fpath;

  globfree(&g);
  return match;
}

optional<string> sp::Util::read_line(const path &fpath, bool failed) {
  const auto p = resolve(fpath);
  if (!p)
    return nullopt;

  std::ifstream ifs(p->string());
  if (!ifs) {
    LOG(llvl::debug) << "Failed to read from: " << *p << " - "
                     << (exists(*p) ? "filesystem error" : "doesn't exist");
    return nullopt;
  }

  string line;
  std::getline(ifs, line);
  const bool read_failed = ifs.bad() || (ifs.fail() && !ifs.eof());
  ifs.close();

  if (read_failed) {
    if (!failed && exists(*p))
      return read_line(*p, true);

    LOG(llvl::debug) << "Failed to read from: " << *p << " - filesystem error";
    return nullopt;
  }

  boost::algorithm::trim(line);
  if (line.empty()) {
    LOG(llvl::debug) << "Empty content: " << *p;
    return nullopt;
  }

  return line;
}

string sp::Util::join(std::initializer_list<pair<bool, string>> args,
                      string join_with) {
  vector<decltype(args.begin())> to_join;
  for (auto it = args.begin(); it != args.end(); ++it) {
    if (it->first)
      to_join.push_back(it);
  }

  std::stringstream ss;
  for (size_t i = 0; i < to_join.size(); ++i) {
    ss << to_join.at(i)->second;
    if (i < to_join.size() - 1)
      ss << join_with;
  }

  return ss.str();
}

bool sp::Util::is_root() { return getuid() == 0; }

bool sp::Util::is_atty() { return isatty(STDOUT_FILENO); }

bool sp::Util::is_host() {
  // The platform monitor container doesn't ship the docker client
  const char *env_path = getenv("PATH");
  if (!env_path)
    return false;

  std::stringstream ss(env_path);
  for (string dir; std::getline(ss, dir, ':');) {
    if (dir.empty())
      continue;

    const path docker = path(dir) / "docker";
    if (access(docker.c_str(), X_OK) == 0)
      return true;
  }

  return false;
}

std::chrono::system_clock::time_point sp::Util::deadline(long ms) {
  return std::chrono::system_clock::now() + std::chrono::milliseconds(ms);
}

bool sp::Util::deep_equal(const google::protobuf::Message &m1,
                          const google::protobuf::Message &m2) {
  return m1.ByteSizeLong() == m2.ByteSizeLong() &&
         m1.SerializeAsString() == m2.SerializeAsString();
}
