#include <gtest/gtest.h>

#include "browser_interface/services/url_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>

using namespace std::string_literals;
using browser_interface::core::BrowserError;
using browser_interface::services::QueryParameters;
using browser_interface::services::UrlBuilder;
using browser_interface::utils::ForbiddenCharacters;

struct UrlBuilderTest : public testing::Test {
protected:
  UrlBuilder builder_{ForbiddenCharacters::posix(), "&"};

  std::string build(std::string_view base, const QueryParameters &params = {}) {
    auto url = builder_.build(base, params);
    EXPECT_TRUE(url.has_value()) << "building " << base << " failed";
    return url.value_or("");
  }

  BrowserError fail(std::string_view base, const QueryParameters &params = {}) {
    auto url = builder_.build(base, params);
    EXPECT_FALSE(url.has_value()) << "building " << base << " gave " << url.value_or("");
    return url.has_value() ? BrowserError::LaunchFailed : url.error();
  }
};

TEST_F(UrlBuilderTest, BaseWithoutParametersIsUnchanged) {
  EXPECT_EQ(build("https://www.example.com"), "https://www.example.com");
  EXPECT_EQ(build("http://www.example.com/a/b/"), "http://www.example.com/a/b/");
  EXPECT_EQ(build("https://www.example.com:8080/x?y=1#z"), "https://www.example.com:8080/x?y=1#z");
}

TEST_F(UrlBuilderTest, BaseLosesOnlyForbiddenCharacters) {
  EXPECT_EQ(build("https://www.example.com/a;b|c"), "https://www.example.com/abc");
  EXPECT_EQ(build("https://www.example.com/?x=1&y=2"), "https://www.example.com/?x=1y=2");
}

TEST_F(UrlBuilderTest, AppendsSingleParameter) {
  EXPECT_EQ(build("https://www.example.com", {{"q", "hello world"}}),
            "https://www.example.com?q=hello world");
}

TEST_F(UrlBuilderTest, JoinsParametersWithoutTrailingSeparator) {
  auto url = build("https://www.example.com", {{"a", 1}, {"b", 2.5}, {"c", true}});
  EXPECT_EQ(url, "https://www.example.com?a=1&b=2.5&c=true");
}

TEST_F(UrlBuilderTest, EveryPairAppearsExactlyOnce) {
  QueryParameters params;
  for (int i = 0; i < 20; ++i) {
    params.add("k" + std::to_string(i), i * 3);
  }
  auto url = build("https://www.example.com/search", params);

  auto query = url.substr(url.find('?') + 1);
  EXPECT_NE(query.back(), '&');

  std::istringstream stream(query);
  std::string pair;
  int count = 0;
  while (std::getline(stream, pair, '&')) {
    EXPECT_EQ(pair, "k" + std::to_string(count) + "=" + std::to_string(count * 3));
    ++count;
  }
  EXPECT_EQ(count, 20);
}

TEST_F(UrlBuilderTest, FiltersKeysAndValues) {
  EXPECT_EQ(build("https://www.example.com", {{"a;b", "c|d&e"}}),
            "https://www.example.com?ab=cde");
}

TEST_F(UrlBuilderTest, UsesPlatformSeparator) {
  UrlBuilder shell_builder(ForbiddenCharacters::posix(), "\\&");
  auto url = shell_builder.build("https://www.example.com", {{"a", 1}, {"b", 2}});
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(*url, "https://www.example.com?a=1\\&b=2");

  UrlBuilder cmd_builder(ForbiddenCharacters::windows(), "^&");
  url = cmd_builder.build("https://www.example.com", {{"a", 1}, {"b", 2}});
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(*url, "https://www.example.com?a=1^&b=2");
}

TEST_F(UrlBuilderTest, AppendsToExistingQuery) {
  EXPECT_EQ(build("https://www.example.com/?x=1", {{"y", 2}}), "https://www.example.com/?x=1&y=2");
  EXPECT_EQ(build("https://www.example.com/?", {{"y", 2}}), "https://www.example.com/?y=2");
}

TEST_F(UrlBuilderTest, FragmentStaysLast) {
  EXPECT_EQ(build("https://www.example.com/page#section", {{"a", 1}}),
            "https://www.example.com/page?a=1#section");
}

TEST_F(UrlBuilderTest, NoQuestionMarkWhenNothingRemains) {
  EXPECT_EQ(build("https://www.example.com", QueryParameters{}), "https://www.example.com");
  EXPECT_EQ(build("https://www.example.com", {{";", "dropped"}}), "https://www.example.com");
}

TEST_F(UrlBuilderTest, CollidingKeysAreRejected) {
  EXPECT_EQ(fail("https://www.example.com", {{"a", 1}, {"a", "1"}}), BrowserError::KeyCollision);
  EXPECT_EQ(fail("https://www.example.com", {{3, "3"}, {"3", "3"}}), BrowserError::KeyCollision);
}

TEST_F(UrlBuilderTest, KeysCollidingAfterFilteringAreRejected) {
  EXPECT_EQ(fail("https://www.example.com", {{"key", 1}, {"k;ey", 2}}), BrowserError::KeyCollision);
  EXPECT_EQ(fail("https://www.example.com", {{"a|", 1}, {"&a", 2}}), BrowserError::KeyCollision);
}

TEST_F(UrlBuilderTest, LargeUnsignedKeyDoesNotCollideWithNegativeKey) {
  EXPECT_EQ(build("https://www.example.com", {{std::numeric_limits<std::uint64_t>::max(), 1}, {"-1", 2}}),
            "https://www.example.com?18446744073709551615=1&-1=2");
}

TEST_F(UrlBuilderTest, DistinctKeysWithEqualValuesAreFine) {
  EXPECT_EQ(build("https://www.example.com", {{"a", 1}, {"b", 1}}), "https://www.example.com?a=1&b=1");
}

TEST_F(UrlBuilderTest, EmptyUrlIsMalformed) {
  EXPECT_EQ(fail(""), BrowserError::MalformedUrl);
  EXPECT_EQ(fail("", {{"a", 1}}), BrowserError::MalformedUrl);
}

TEST_F(UrlBuilderTest, UnparsableUrlIsMalformed) {
  EXPECT_EQ(fail("QWERTYUIOPASDFG"), BrowserError::MalformedUrl);
  EXPECT_EQ(fail("www.example.com"), BrowserError::MalformedUrl);
  EXPECT_EQ(fail("https://"), BrowserError::MalformedUrl);
}

TEST_F(UrlBuilderTest, WrongSchemeIsMalformed) {
  EXPECT_EQ(fail("ftp://www.example.com"), BrowserError::MalformedUrl);
  EXPECT_EQ(fail("file:///etc/passwd"), BrowserError::MalformedUrl);
  EXPECT_EQ(fail("javascript:alert(1)"), BrowserError::MalformedUrl);
}

TEST_F(UrlBuilderTest, SchemeIsCheckedBeforeFiltering) {
  // A newline would otherwise be filtered into a valid url
  EXPECT_EQ(fail("https://www.exa\nmple.com"), BrowserError::MalformedUrl);
}

namespace {
// The separators the builder inserts are the only '&' allowed through
std::string without_separators(std::string url, const std::string &separator) {
  for (size_t pos = url.find(separator); pos != std::string::npos; pos = url.find(separator, pos)) {
    url.erase(pos, separator.size());
  }
  return url;
}
} // namespace

TEST_F(UrlBuilderTest, CallerTextNeverContainsForbiddenCharacters) {
  struct Case {
    ForbiddenCharacters forbidden;
    std::string separator;
  };
  const Case cases[] = {
      {ForbiddenCharacters::posix(), "&"},
      {ForbiddenCharacters::posix(), "\\&"},
      {ForbiddenCharacters::macos(), "\\&"},
      {ForbiddenCharacters::windows(), "^&"},
  };

  for (const auto &c : cases) {
    UrlBuilder builder(c.forbidden, c.separator);
    auto url = builder.build("https://www.example.com/$HOME/`id`^&x",
                             {{"cmd", "a;b&c"}, {"x'", "\"y\""}, {"n", "line\nbreak"}, {"z", "\0^&"s}});
    ASSERT_TRUE(url.has_value()) << "separator " << c.separator;
    EXPECT_EQ(std::count(url->begin(), url->end(), '?'), 1);

    auto caller_text = without_separators(*url, c.separator);
    for (char ch : caller_text) {
      EXPECT_FALSE(c.forbidden.contains(ch))
          << "found " << static_cast<int>(ch) << " in " << *url << " (separator " << c.separator << ")";
    }
  }
}

TEST_F(UrlBuilderTest, OnlyInsertedSeparatorsCarryAmpersands) {
  auto url = build("https://www.example.com/a&b", {{"k&1", "v&1"}, {"k2", "v2"}, {"k3", "v3"}});
  EXPECT_EQ(url, "https://www.example.com/ab?k1=v1&k2=v2&k3=v3");
  EXPECT_EQ(std::count(url.begin(), url.end(), '&'), 2);
}
