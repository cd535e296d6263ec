#include "Semver.hpp"

#include <algorithm>
#include <cctype>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

namespace {

class VersionParser {
public:
  explicit VersionParser(const std::string_view str) noexcept : str(str) {}

  rs::Result<Version> parse() {
    rs_ensure(!str.empty(), "invalid semver: empty string");

    Version version;
    version.major = rs_try(parseNum());
    rs_try(expect('.'));
    version.minor = rs_try(parseNum());
    rs_try(expect('.'));
    version.patch = rs_try(parseNum());

    if (pos < str.size() && str[pos] == '-') {
      ++pos;
      version.pre = rs_try(parseIdents(/*isPre=*/true));
    }
    if (pos < str.size() && str[pos] == '+') {
      ++pos;
      version.build = rs_try(parseIdents(/*isPre=*/false));
    }
    if (pos < str.size()) {
      return error("unexpected character");
    }
    return rs::Ok(std::move(version));
  }

private:
  std::string_view str;
  std::size_t pos = 0;

  // Renders the input with carets under the offending span.
  rs::AnyhowErr error(const std::string_view msg,
                      std::size_t len = 1) const {
    const std::size_t start = std::min(pos, str.size());
    len = std::max<std::size_t>(1, std::min(len, str.size() + 1 - start));
    return rs::Err(rs::anyhow(fmt::format("invalid semver:\n{}\n{}{} {}", str,
                                          std::string(start, ' '),
                                          std::string(len, '^'), msg)));
  }

  rs::Result<void> expect(const char c) {
    if (pos < str.size() && str[pos] == c) {
      ++pos;
      return rs::Ok();
    }
    return error(fmt::format("expected `{}`", c));
  }

  rs::Result<uint64_t> parseNum() {
    const std::size_t start = pos;
    while (pos < str.size()
           && std::isdigit(static_cast<unsigned char>(str[pos]))) {
      ++pos;
    }
    if (start == pos) {
      pos = start;
      std::size_t len = 0;
      while (start + len < str.size() && str[start + len] != '.') {
        ++len;
      }
      return error("expected number", len);
    }

    const std::string_view digits = str.substr(start, pos - start);
    if (digits.size() > 1 && digits.front() == '0') {
      pos = start;
      return error("invalid leading zero", digits.size());
    }

    uint64_t value = 0;
    for (const char c : digits) {
      const auto digit = static_cast<uint64_t>(c - '0');
      if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
        pos = start;
        return error("number exceeds UINT64_MAX", digits.size());
      }
      value = value * 10 + digit;
    }
    return rs::Ok(value);
  }

  rs::Result<std::vector<std::string>> parseIdents(const bool isPre) {
    std::vector<std::string> idents;
    while (true) {
      const std::size_t start = pos;
      while (pos < str.size()
             && (std::isalnum(static_cast<unsigned char>(str[pos]))
                 || str[pos] == '-')) {
        ++pos;
      }
      if (start == pos) {
        return error("expected identifier");
      }

      const std::string_view ident = str.substr(start, pos - start);
      const bool numeric = std::ranges::all_of(ident, [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c));
      });
      if (isPre && numeric && ident.size() > 1 && ident.front() == '0') {
        pos = start;
        return error("invalid leading zero", ident.size());
      }
      idents.emplace_back(ident);

      if (pos < str.size() && str[pos] == '.') {
        ++pos;
        continue;
      }
      return rs::Ok(std::move(idents));
    }
  }
};

bool isNumeric(const std::string_view ident) noexcept {
  return !ident.empty() && std::ranges::all_of(ident, [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  });
}

std::strong_ordering comparePreIdent(const std::string& lhs,
                                     const std::string& rhs) noexcept {
  const bool lhsNum = isNumeric(lhs);
  const bool rhsNum = isNumeric(rhs);
  if (lhsNum && rhsNum) {
    if (lhs.size() != rhs.size()) {
      return lhs.size() <=> rhs.size();
    }
    return lhs.compare(rhs) <=> 0;
  }
  if (lhsNum) {
    return std::strong_ordering::less; // numeric ids have lower precedence
  }
  if (rhsNum) {
    return std::strong_ordering::greater;
  }
  return lhs.compare(rhs) <=> 0;
}

} // namespace

rs::Result<Version> Version::parse(const std::string_view str) {
  return VersionParser(str).parse();
}

std::string Version::toString() const {
  std::string str = fmt::format("{}.{}.{}", major, minor, patch);
  if (!pre.empty()) {
    str += fmt::format("-{}", fmt::join(pre, "."));
  }
  if (!build.empty()) {
    str += fmt::format("+{}", fmt::join(build, "."));
  }
  return str;
}

bool Version::operator==(const Version& other) const noexcept {
  return (*this <=> other) == std::strong_ordering::equal;
}

std::strong_ordering
Version::operator<=>(const Version& other) const noexcept {
  if (const auto cmp = major <=> other.major; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = minor <=> other.minor; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = patch <=> other.patch; cmp != 0) {
    return cmp;
  }

  // A pre-release version has lower precedence than the normal version.
  if (pre.empty() && other.pre.empty()) {
    return std::strong_ordering::equal;
  } else if (pre.empty()) {
    return std::strong_ordering::greater;
  } else if (other.pre.empty()) {
    return std::strong_ordering::less;
  }

  const std::size_t common = std::min(pre.size(), other.pre.size());
  for (std::size_t i = 0; i < common; ++i) {
    if (const auto cmp = comparePreIdent(pre[i], other.pre[i]); cmp != 0) {
      return cmp;
    }
  }
  return pre.size() <=> other.pre.size();
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <rs/tests.hpp>

namespace trellis {

static void testParse() {
  const Version version = Version::parse("1.4.0").unwrap();
  tests::assertEq(version.major, 1UL);
  tests::assertEq(version.minor, 4UL);
  tests::assertEq(version.patch, 0UL);
  tests::assertTrue(version.pre.empty());

  const Version full = Version::parse("2.0.0-rc.1+build.7").unwrap();
  tests::assertEq(full.toString(), "2.0.0-rc.1+build.7");
  tests::assertEq(full.pre.size(), 2UL);
  tests::assertEq(full.build.size(), 2UL);

  tests::pass();
}

static void testParseErrors() {
  tests::assertEq(Version::parse("").unwrap_err()->what(),
                  "invalid semver: empty string");
  tests::assertEq(Version::parse("invalid").unwrap_err()->what(),
                  "invalid semver:\n"
                  "invalid\n"
                  "^^^^^^^ expected number");
  tests::assertEq(Version::parse("1.2").unwrap_err()->what(),
                  "invalid semver:\n"
                  "1.2\n"
                  "   ^ expected `.`");
  tests::assertEq(Version::parse("01.2.3").unwrap_err()->what(),
                  "invalid semver:\n"
                  "01.2.3\n"
                  "^^ invalid leading zero");
  tests::assertEq(Version::parse("1.2.3-").unwrap_err()->what(),
                  "invalid semver:\n"
                  "1.2.3-\n"
                  "      ^ expected identifier");
  tests::assertEq(Version::parse("1.2.3 ").unwrap_err()->what(),
                  "invalid semver:\n"
                  "1.2.3 \n"
                  "     ^ unexpected character");

  tests::pass();
}

static void testOrdering() {
  const auto v = [](const std::string_view str) {
    return Version::parse(str).unwrap();
  };

  tests::assertTrue(v("1.0.0") < v("2.0.0"));
  tests::assertTrue(v("1.2.0") < v("1.10.0"));
  tests::assertTrue(v("1.0.0-alpha") < v("1.0.0"));
  tests::assertTrue(v("1.0.0-alpha") < v("1.0.0-alpha.1"));
  tests::assertTrue(v("1.0.0-alpha.1") < v("1.0.0-alpha.beta"));
  tests::assertTrue(v("1.0.0-beta.2") < v("1.0.0-beta.11"));
  tests::assertTrue(v("1.0.0-rc.1") < v("1.0.0"));
  tests::assertTrue(v("1.0.0+a") == v("1.0.0+b"));
  tests::assertFalse(v("1.0.0") < v("1.0.0-rc.1"));

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testParse();
  trellis::testParseErrors();
  trellis::testOrdering();
}

#endif
