#ifndef ISOFETCH_CATALOG_CATALOG_ENTRIES_HPP_
#define ISOFETCH_CATALOG_CATALOG_ENTRIES_HPP_

#include <istream>
#include <string>
#include <vector>

#include "Transfer/TransferTypes.hpp"

namespace isofetch {

struct CatalogEntry {
  std::string displayName;
  std::string url;

  TransferRequest toRequest() const { return TransferRequest{url, ""}; }
};

bool looksLikeUrl(const std::string& text);

// One entry per line: "Display Name: scheme://..." or a bare URL. Headings,
// blank lines and lines without a URL are skipped.
std::vector<CatalogEntry> parseCatalogEntries(std::istream& in);
std::vector<CatalogEntry> parseCatalogEntries(const std::string& text);
// Throws std::runtime_error when the file cannot be opened.
std::vector<CatalogEntry> loadCatalogFile(const std::string& path);

}  // namespace isofetch

#endif  // ISOFETCH_CATALOG_CATALOG_ENTRIES_HPP_
