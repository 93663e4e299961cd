#include "mirror/mirror_list.h"
#include "utilities/http.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace gutex {

Mirror defaultMirror() {
  return Mirror{"https://www.gutenberg.org", "Project Gutenberg", "Default",
                "Primary site", ""};
}

static std::vector<std::string> splitColumns(const std::string &line) {
  std::vector<std::string> parts;
  std::stringstream ss(line);
  std::string part;
  while (std::getline(ss, part, '|'))
    parts.push_back(trim(part));
  // getline drops a trailing empty field; "a|b|" has three columns.
  if (!line.empty() && line.back() == '|')
    parts.emplace_back();
  return parts;
}

static bool startsWith(const std::string &s, const std::string &prefix) {
  return s.rfind(prefix, 0) == 0;
}

static bool isHighSpeed(const Mirror &m) {
  std::string note = m.note;
  std::transform(note.begin(), note.end(), note.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return note.find("high speed") != std::string::npos;
}

std::vector<Mirror> parseMirrorList(const std::string &content) {
  static const std::regex rowsFooter(R"(^\s*\(\d+ rows\))");
  std::vector<Mirror> mirrors;
  std::unordered_set<std::string> seen;

  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.find("continent") != std::string::npos ||
        line.find("---") != std::string::npos || trim(line).empty())
      continue;
    if (std::regex_search(line, rowsFooter))
      continue;

    auto parts = splitColumns(line);
    if (parts.size() < 5)
      continue;
    parts.resize(6);
    const std::string &continent = parts[0];
    const std::string &nation = parts[1];
    const std::string &location = parts[2];
    const std::string &provider = parts[3];
    std::string baseUrl = parts[4];
    const std::string &note = parts[5];

    if (!startsWith(baseUrl, "http://") && !startsWith(baseUrl, "https://"))
      continue;
    while (!baseUrl.empty() && baseUrl.back() == '/')
      baseUrl.pop_back();
    if (baseUrl.find("/dirs") != std::string::npos ||
        baseUrl.find("gutenberg-epub") != std::string::npos)
      continue;
    if (!seen.insert(baseUrl).second)
      continue;

    std::string place = location;
    if (!nation.empty())
      place = place.empty() ? nation : place + ", " + nation;

    mirrors.push_back(Mirror{baseUrl, provider.empty() ? "Unknown" : provider,
                             place, note, continent});
  }

  std::stable_sort(mirrors.begin(), mirrors.end(),
                   [](const Mirror &a, const Mirror &b) {
                     bool aHttps = startsWith(a.baseUrl, "https://");
                     bool bHttps = startsWith(b.baseUrl, "https://");
                     if (aHttps != bHttps)
                       return aHttps;
                     return isHighSpeed(a) && !isHighSpeed(b);
                   });
  return mirrors;
}

std::string buildResourceUrl(const std::string &baseUrl,
                             const std::string &pathTemplate,
                             const std::string &resourceId) {
  std::string path = pathTemplate;
  const std::string placeholder = "{id}";
  for (auto pos = path.find(placeholder); pos != std::string::npos;
       pos = path.find(placeholder, pos + resourceId.size()))
    path.replace(pos, placeholder.size(), resourceId);
  return baseUrl + path;
}

} // namespace gutex
