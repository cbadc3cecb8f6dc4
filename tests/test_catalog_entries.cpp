/**
 * @file test_catalog_entries.cpp
 * @brief Tests for URL list parsing and file name derivation
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "Catalog/CatalogEntries.hpp"
#include "test_fixtures.hpp"

namespace isofetch {
namespace test {

class FilenameFromUrlTest : public ::testing::Test {};

TEST_F(FilenameFromUrlTest, TakesLastPathSegment) {
  EXPECT_EQ(filenameFromUrl("https://cdimage.debian.org/debian-cd/current/"
                            "amd64/iso-cd/debian-12.5.0-amd64-netinst.iso"),
            "debian-12.5.0-amd64-netinst.iso");
}

TEST_F(FilenameFromUrlTest, StripsQueryAndFragment) {
  EXPECT_EQ(filenameFromUrl("https://example.org/a/b.iso?mirror=1#top"),
            "b.iso");
  EXPECT_EQ(filenameFromUrl("https://example.org/a/b.iso#frag"), "b.iso");
}

TEST_F(FilenameFromUrlTest, EmptyWhenNoFileNamed) {
  EXPECT_EQ(filenameFromUrl("https://example.org"), "");
  EXPECT_EQ(filenameFromUrl("https://example.org/"), "");
  EXPECT_EQ(filenameFromUrl("https://example.org/isos/"), "");
  EXPECT_EQ(filenameFromUrl("https://example.org/isos/.."), "");
}

TEST_F(FilenameFromUrlTest, HintWins) {
  EXPECT_EQ(resolveFilename(TransferRequest{"https://example.org/get?id=3",
                                            "fedora.iso"}),
            "fedora.iso");
  EXPECT_EQ(resolveFilename(TransferRequest{"https://example.org/x.iso", ""}),
            "x.iso");
}

class CatalogEntriesTest : public TempDirectoryFixture {};

TEST_F(CatalogEntriesTest, ParsesNamedAndBareEntries) {
  const std::string text =
      "# Linux\n"
      "\n"
      "Debian 12: https://example.org/debian-12.iso\n"
      "- Fedora Workstation: https://example.org/fedora.iso\n"
      "https://example.org/arch.iso\n"
      "just some text\n"
      "Notes: not a url\n";

  auto entries = parseCatalogEntries(text);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].displayName, "Debian 12");
  EXPECT_EQ(entries[0].url, "https://example.org/debian-12.iso");
  EXPECT_EQ(entries[1].displayName, "Fedora Workstation");
  EXPECT_EQ(entries[1].url, "https://example.org/fedora.iso");
  EXPECT_EQ(entries[2].displayName, "arch.iso");
  EXPECT_EQ(entries[2].url, "https://example.org/arch.iso");
}

TEST_F(CatalogEntriesTest, UrlColonsDoNotSplitTheName) {
  auto entries =
      parseCatalogEntries("Ubuntu 24.04: https://example.org:8443/u.iso\n");
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].displayName, "Ubuntu 24.04");
  EXPECT_EQ(entries[0].url, "https://example.org:8443/u.iso");
}

TEST_F(CatalogEntriesTest, ToRequestCarriesUrl) {
  CatalogEntry entry{"Arch", "https://example.org/arch.iso"};
  auto request = entry.toRequest();
  EXPECT_EQ(request.url, entry.url);
  EXPECT_TRUE(request.destinationHint.empty());
}

TEST_F(CatalogEntriesTest, LooksLikeUrl) {
  EXPECT_TRUE(looksLikeUrl("http://a/b"));
  EXPECT_TRUE(looksLikeUrl("https://a/b"));
  EXPECT_TRUE(looksLikeUrl("ftp://a/b"));
  EXPECT_TRUE(looksLikeUrl("file:///tmp/b"));
  EXPECT_FALSE(looksLikeUrl("a/b"));
  EXPECT_FALSE(looksLikeUrl("--target_dir=x"));
}

TEST_F(CatalogEntriesTest, LoadsFromFile) {
  auto path = writeFile("isos.txt",
                        "Alpine: https://example.org/alpine.iso\r\n"
                        "  * Void: https://example.org/void.iso  \r\n");
  auto entries = loadCatalogFile(path.string());
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].url, "https://example.org/alpine.iso");
  EXPECT_EQ(entries[1].displayName, "Void");
  EXPECT_EQ(entries[1].url, "https://example.org/void.iso");
}

TEST_F(CatalogEntriesTest, MissingFileThrows) {
  EXPECT_THROW(loadCatalogFile((test_dir_ / "absent.txt").string()),
               std::runtime_error);
}

}  // namespace test
}  // namespace isofetch
