#include "CatalogEntries.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "logger.hpp"

namespace isofetch {

namespace {

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

// Markdown list markers in front of an entry.
std::string stripListMarker(const std::string& line) {
  if (line.size() > 1 && (line[0] == '-' || line[0] == '*') && line[1] == ' ') {
    return trim(line.substr(2));
  }
  return line;
}

}  // namespace

bool looksLikeUrl(const std::string& text) {
  static const char* const kSchemes[] = {"http://", "https://", "ftp://",
                                         "file://"};
  for (const char* scheme : kSchemes) {
    if (text.rfind(scheme, 0) == 0) return true;
  }
  return false;
}

std::vector<CatalogEntry> parseCatalogEntries(std::istream& in) {
  std::vector<CatalogEntry> entries;
  std::string raw;
  while (std::getline(in, raw)) {
    const std::string line = stripListMarker(trim(raw));
    if (line.empty() || line[0] == '#') continue;

    if (looksLikeUrl(line)) {
      entries.push_back(CatalogEntry{filenameFromUrl(line), line});
      continue;
    }

    const auto sep = line.find(": ");
    if (sep == std::string::npos) continue;
    const std::string url = trim(line.substr(sep + 2));
    if (!looksLikeUrl(url)) {
      LOG(DEBUG) << "Skipping catalog line without URL: " << line;
      continue;
    }
    entries.push_back(CatalogEntry{trim(line.substr(0, sep)), url});
  }
  return entries;
}

std::vector<CatalogEntry> parseCatalogEntries(const std::string& text) {
  std::istringstream in(text);
  return parseCatalogEntries(in);
}

std::vector<CatalogEntry> loadCatalogFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open URL file: " + path);
  }
  return parseCatalogEntries(in);
}

}  // namespace isofetch
