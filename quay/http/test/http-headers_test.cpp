#include "quay/http-headers.hpp"

#include <gtest/gtest.h>

#include <iterator>

namespace quay {

TEST(HttpHeadersTest, CaseInsensitiveLookups) {
  HttpHeaders headers;
  headers.add("Content-Type", "text/plain");
  EXPECT_EQ(headers.getOrEmpty("content-type"), "text/plain");
  EXPECT_TRUE(headers.contains("CONTENT-TYPE"));
  EXPECT_FALSE(headers.get("Content-Length").has_value());
  EXPECT_EQ(headers.getOrEmpty("Content-Length"), "");
}

TEST(HttpHeadersTest, SetReplacesAllDuplicates) {
  HttpHeaders headers;
  headers.add("X-A", "1").add("x-a", "2").add("X-B", "3");
  EXPECT_EQ(headers.count("X-A"), 2U);
  headers.set("X-A", "4");
  EXPECT_EQ(headers.count("X-A"), 1U);
  EXPECT_EQ(headers.getOrEmpty("X-A"), "4");
  EXPECT_EQ(headers.size(), 2U);
}

TEST(HttpHeadersTest, PreservesInsertionOrder) {
  HttpHeaders headers;
  headers.set("B", "1").set("A", "2").set("C", "3");
  headers.set("A", "4");
  auto it = headers.begin();
  EXPECT_EQ(it->first, "B");
  EXPECT_EQ(std::next(it)->first, "A");
  EXPECT_EQ(std::next(it)->second, "4");
  EXPECT_EQ(std::next(it, 2)->first, "C");
}

TEST(HttpHeadersTest, Erase) {
  HttpHeaders headers;
  headers.add("X", "1").add("x", "2").add("Y", "3");
  EXPECT_EQ(headers.erase("X"), 2U);
  EXPECT_EQ(headers.erase("X"), 0U);
  EXPECT_EQ(headers.size(), 1U);
  headers.clear();
  EXPECT_TRUE(headers.empty());
}

}  // namespace quay
