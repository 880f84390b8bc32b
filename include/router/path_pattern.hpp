#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace biowiki {
namespace router {

using PathParams = std::map<std::string, std::string>;

// A compiled path pattern such as "/webs/:web_name/pages".
// Literal segments match verbatim, ":name" segments match one non-empty
// path component and are captured under that name.
class PathPattern {
public:
  explicit PathPattern(const std::string& pattern);

  // Every declared parameter bound to its segment, or nullopt.
  // Patterns that declare the same name twice never match.
  std::optional<PathParams> match(const std::string& path) const;

  // Parameter names in declaration order
  const std::vector<std::string>& names() const { return names_; }
  const std::string& pattern() const { return pattern_; }

private:
  std::string pattern_;
  std::vector<std::string> names_;
  std::regex re_;

  static std::regex compile(const std::string& pattern, std::vector<std::string>& names);
};

} // namespace router
} // namespace biowiki
