#include "helpers.hpp"

#include <boost/ut.hpp>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "trellis version"_test = [] {
    const auto result = tests::runTrellis({ "version" }).unwrap();
    expect(result.status.success());

    static const std::regex pattern(
        R"(^trellis ([^\s]+)( \([0-9a-f]{8} [0-9]{4}-[0-9]{2}-[0-9]{2}\))?\n$)");
    std::smatch match;
    expect(std::regex_match(result.out, match, pattern)) << result.out;
    expect(match[1].str() == TRELLIS_PKG_VERSION) << match[1].str();
    expect(result.err.empty()) << result.err;
  };

  "trellis --version"_test = [] {
    const auto subcmd = tests::runTrellis({ "version" }).unwrap();
    const auto flag = tests::runTrellis({ "-V" }).unwrap();
    expect(flag.status.success());
    expect(flag.out == subcmd.out) << flag.out;
  };

  "trellis version --verbose"_test = [] {
    const auto result = tests::runTrellis({ "version", "-v" }).unwrap();
    expect(result.status.success());
    expect(result.out.contains(
        std::string("release: ") + TRELLIS_PKG_VERSION + "\n"))
        << result.out;
    expect(result.out.contains("compiler: ")) << result.out;
    expect(result.out.contains("libgit2: ")) << result.out;
  };
}
