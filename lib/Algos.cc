#include "Algos.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

std::string toMacroName(const std::string_view name) noexcept {
  std::string macroName;
  macroName.reserve(name.size());
  for (const unsigned char c : name) {
    if (std::isalnum(c)) {
      macroName += static_cast<char>(std::toupper(c));
    } else {
      macroName += '_';
    }
  }
  return macroName;
}

std::string replaceAll(std::string str, const std::string_view from,
                       const std::string_view to) noexcept {
  if (from.empty()) {
    return str; // If the substring to replace is empty, return the original
  }

  std::size_t startPos = 0;
  while ((startPos = str.find(from, startPos)) != std::string::npos) {
    str.replace(startPos, from.length(), to);
    startPos += to.length(); // Handles case where 'to' is a substring of 'from'
  }
  return str;
}

// Levenshtein distance with a rolling row.
std::size_t levDistance(const std::string_view lhs,
                        const std::string_view rhs) noexcept {
  const std::size_t lhsSize = lhs.size();
  const std::size_t rhsSize = rhs.size();

  std::vector<std::size_t> row(rhsSize + 1);
  for (std::size_t j = 0; j <= rhsSize; ++j) {
    row[j] = j;
  }

  for (std::size_t i = 1; i <= lhsSize; ++i) {
    std::size_t diag = row[0];
    row[0] = i;
    for (std::size_t j = 1; j <= rhsSize; ++j) {
      const std::size_t above = row[j];
      const std::size_t cost = lhs[i - 1] == rhs[j - 1] ? 0 : 1;
      row[j] = std::min({ row[j] + 1, row[j - 1] + 1, diag + cost });
      diag = above;
    }
  }
  return row[rhsSize];
}

static bool equalsInsensitive(const std::string_view lhs,
                              const std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](const char a, const char b) {
    return std::tolower(static_cast<unsigned char>(a))
           == std::tolower(static_cast<unsigned char>(b));
  });
}

std::optional<std::string_view>
findSimilarStr(const std::string_view lhs,
               const std::span<const std::string_view> candidates) noexcept {
  // The maximum edit distance a suggestion may have.
  static constexpr std::size_t maxDist = 3;

  std::optional<std::string_view> similarStr = std::nullopt;
  std::size_t bestDist = maxDist + 1;
  for (const std::string_view candidate : candidates) {
    if (equalsInsensitive(candidate, lhs)) {
      return candidate;
    }

    const std::size_t curDist = levDistance(candidate, lhs);
    // A one-letter input should not match everything one edit away.
    if (curDist >= std::max(lhs.size(), candidate.size())) {
      continue;
    }
    if (curDist < bestDist) {
      bestDist = curDist;
      similarStr = candidate;
    }
  }
  return similarStr;
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <array>
#  include <rs/tests.hpp>

namespace trellis {

static void testLevDistance() {
  tests::assertEq(levDistance("", ""), 0UL);
  tests::assertEq(levDistance("build", "build"), 0UL);
  tests::assertEq(levDistance("build", "buidl"), 2UL);
  tests::assertEq(levDistance("test", "tests"), 1UL);
  tests::assertEq(levDistance("", "pack"), 4UL);
  tests::assertEq(levDistance("kitten", "sitting"), 3UL);

  tests::pass();
}

static void testFindSimilarStr() {
  constexpr std::array<std::string_view, 6> candidates{
    "clean", "restore", "build", "test", "coverage", "publish"
  };

  using Found = std::optional<std::string_view>;
  tests::assertEq(findSimilarStr("biuld", candidates), Found("build"));
  tests::assertEq(findSimilarStr("TEST", candidates), Found("test"));
  tests::assertEq(findSimilarStr("resotre", candidates), Found("restore"));
  tests::assertEq(findSimilarStr("publsh", candidates), Found("publish"));
  tests::assertFalse(findSimilarStr("zzzzzzzzzz", candidates).has_value());
  tests::assertFalse(findSimilarStr("x", candidates).has_value());

  tests::pass();
}

static void testToMacroName() {
  tests::assertEq(toMacroName("build"), "BUILD");
  tests::assertEq(toMacroName("code-coverage"), "CODE_COVERAGE");
  tests::assertEq(replaceAll("a-b-c", "-", "::"), "a::b::c");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testLevDistance();
  trellis::testFindSimilarStr();
  trellis::testToMacroName();
}

#endif
