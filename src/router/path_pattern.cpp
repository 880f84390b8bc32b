#include "router/path_pattern.hpp"
#include <sstream>

namespace biowiki {
namespace router {

namespace {

std::string escape_literal(const std::string& segment) {
  static const std::string SPECIAL = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(segment.size());
  for (char c : segment) {
    if (SPECIAL.find(c) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

} // namespace

PathPattern::PathPattern(const std::string& pattern)
  : pattern_(pattern)
  , re_(compile(pattern, names_)) {
}

std::regex PathPattern::compile(const std::string& pattern, std::vector<std::string>& names) {
  std::string re = "^";

  // Segments after the leading '/'
  std::string body = (!pattern.empty() && pattern[0] == '/') ? pattern.substr(1) : pattern;
  std::istringstream segments(body);
  std::string part;
  bool any = false;
  while (std::getline(segments, part, '/')) {
    any = true;
    re.push_back('/');
    if (!part.empty() && part[0] == ':') {
      names.push_back(part.substr(1));
      re += "([^/]+)";
    } else {
      re += escape_literal(part);
    }
  }
  if (!any || (!body.empty() && body.back() == '/')) {
    re.push_back('/');
  }
  re.push_back('$');

  return std::regex(re);
}

std::optional<PathParams> PathPattern::match(const std::string& path) const {
  std::smatch caps;
  if (!std::regex_match(path, caps, re_)) {
    return std::nullopt;
  }

  PathParams params;
  for (size_t i = 0; i < names_.size() && i + 1 < caps.size(); ++i) {
    params.emplace(names_[i], caps[i + 1].str());
  }
  // A repeated name collapses into one entry
  if (params.size() != names_.size()) {
    return std::nullopt;
  }
  return params;
}

} // namespace router
} // namespace biowiki
