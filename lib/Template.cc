#include "Template.hpp"

#include "Algos.hpp"

#include <cctype>
#include <cstddef>
#include <memory>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

PlaceholderMap& PlaceholderMap::set(std::string key, std::string value) {
  auto lazy = std::make_shared<LazyValue>();
  lazy->value = std::move(value);
  entries.insert_or_assign(std::move(key),
                           Entry{ .lazy = std::move(lazy), .secret = false });
  return *this;
}

PlaceholderMap& PlaceholderMap::setSecret(std::string key, std::string value) {
  auto lazy = std::make_shared<LazyValue>();
  lazy->value = std::move(value);
  entries.insert_or_assign(std::move(key),
                           Entry{ .lazy = std::move(lazy), .secret = true });
  return *this;
}

PlaceholderMap& PlaceholderMap::setLazy(std::string key, Producer producer) {
  auto lazy = std::make_shared<LazyValue>();
  lazy->producer = std::move(producer);
  entries.insert_or_assign(std::move(key),
                           Entry{ .lazy = std::move(lazy), .secret = false });
  return *this;
}

bool PlaceholderMap::contains(const std::string_view key) const {
  return entries.contains(key);
}

rs::Result<std::string> PlaceholderMap::get(const std::string_view key) const {
  const auto itr = entries.find(key);
  rs_ensure(itr != entries.end(), "unknown placeholder `{{{}}}`", key);

  LazyValue& lazy = *itr->second.lazy;
  if (!lazy.value.has_value()) {
    spdlog::trace("Computing placeholder `{{{}}}`", key);
    lazy.value = rs_try(lazy.producer());
  }
  return rs::Ok(*lazy.value);
}

static bool isPlaceholderChar(const char c) noexcept {
  return std::islower(static_cast<unsigned char>(c))
         || std::isdigit(static_cast<unsigned char>(c)) || c == '_';
}

rs::Result<std::string>
PlaceholderMap::expand(const std::string_view text,
                       const std::string_view context) const {
  std::string result;
  result.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '}') {
      rs_ensure(i + 1 < text.size() && text[i + 1] == '}',
                "unmatched `}}` in `{}` action: {}", context, text);
      result.push_back('}');
      ++i;
      continue;
    }
    if (c != '{') {
      result.push_back(c);
      continue;
    }
    if (i + 1 < text.size() && text[i + 1] == '{') {
      result.push_back('{');
      ++i;
      continue;
    }

    const std::size_t close = text.find('}', i + 1);
    rs_ensure(close != std::string_view::npos,
              "unterminated placeholder in `{}` action: {}", context, text);
    const std::string_view key = text.substr(i + 1, close - i - 1);
    bool valid = !key.empty();
    for (const char k : key) {
      valid = valid && isPlaceholderChar(k);
    }
    rs_ensure(valid && contains(key), "unknown placeholder `{{{}}}` in `{}` action",
              key, context);

    result += rs_try(get(key));
    i = close;
  }
  return rs::Ok(std::move(result));
}

rs::Result<std::vector<std::string>>
PlaceholderMap::expand(const CommandTemplate& tmpl,
                       const std::string_view context) const {
  std::vector<std::string> args;
  args.reserve(tmpl.size());
  for (const std::string& arg : tmpl) {
    args.push_back(rs_try(expand(arg, context)));
  }
  return rs::Ok(std::move(args));
}

std::string PlaceholderMap::redact(std::string text) const {
  for (const auto& [key, entry] : entries) {
    if (!entry.secret || !entry.lazy->value.has_value()
        || entry.lazy->value->empty()) {
      continue;
    }
    text = replaceAll(std::move(text), *entry.lazy->value, "***");
  }
  return text;
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>

namespace trellis {

static void testExpand() {
  PlaceholderMap map;
  map.set("project", "acme-core").set("configuration", "release");

  tests::assertEq(map.expand("{project}", "build").unwrap(), "acme-core");
  tests::assertEq(map.expand("-c={configuration}!", "build").unwrap(),
                  "-c=release!");
  tests::assertEq(map.expand("{project}-{configuration}", "build").unwrap(),
                  "acme-core-release");
  tests::assertEq(map.expand("no fields", "build").unwrap(), "no fields");
  tests::assertEq(map.expand("", "build").unwrap(), "");

  const CommandTemplate tmpl = { "dotnet", "build", "{project}", "-c",
                                 "{configuration}" };
  tests::assertEq(map.expand(tmpl, "build").unwrap(),
                  std::vector<std::string>{ "dotnet", "build", "acme-core",
                                            "-c", "release" });

  tests::pass();
}

static void testEscapes() {
  PlaceholderMap map;
  map.set("project", "core");

  tests::assertEq(map.expand("{{project}}", "lint").unwrap(), "{project}");
  tests::assertEq(map.expand("{{{project}}}", "lint").unwrap(), "{core}");
  tests::assertEq(map.expand("a}}b", "lint").unwrap(), "a}b");

  tests::pass();
}

static void testErrors() {
  PlaceholderMap map;
  map.set("project", "core");

  tests::assertEq(map.expand("{projcet}", "build").unwrap_err()->what(),
                  "unknown placeholder `{projcet}` in `build` action");
  tests::assertEq(map.expand("{}", "build").unwrap_err()->what(),
                  "unknown placeholder `{}` in `build` action");
  tests::assertEq(map.expand("{Project}", "build").unwrap_err()->what(),
                  "unknown placeholder `{Project}` in `build` action");
  tests::assertEq(map.expand("{project", "build").unwrap_err()->what(),
                  "unterminated placeholder in `build` action: {project");
  tests::assertEq(map.expand("a}b", "build").unwrap_err()->what(),
                  "unmatched `}` in `build` action: a}b");

  tests::pass();
}

static void testLazy() {
  int calls = 0;
  PlaceholderMap map;
  map.setLazy("commit", [&calls]() -> rs::Result<std::string> {
    ++calls;
    return rs::Ok(std::string("0123abc"));
  });
  map.setLazy("build", []() -> rs::Result<std::string> {
    rs_bail("tool `dotnet` not found in PATH (set TRELLIS_BUILD to override)");
  });

  tests::assertEq(calls, 0);
  tests::assertEq(map.expand("v-{commit}", "pack").unwrap(), "v-0123abc");

  const PlaceholderMap copy = map;
  tests::assertEq(copy.expand("{commit}", "pack").unwrap(), "0123abc");
  tests::assertEq(calls, 1);

  // Unused lazy values are never computed.
  tests::assertEq(map.expand("{commit}", "pack").unwrap(), "0123abc");
  tests::assertEq(map.expand("{build}", "pack").unwrap_err()->what(),
                  "tool `dotnet` not found in PATH (set TRELLIS_BUILD to "
                  "override)");

  tests::pass();
}

static void testRedact() {
  PlaceholderMap map;
  map.set("feed", "https://packages.example.com").setSecret("api_key", "s3cr3t");

  const std::string line = map.expand("push --source {feed} --api-key {api_key}",
                                      "publish")
                               .unwrap();
  tests::assertEq(line,
                  "push --source https://packages.example.com --api-key s3cr3t");
  tests::assertEq(map.redact(line),
                  "push --source https://packages.example.com --api-key ***");

  PlaceholderMap empty;
  empty.setSecret("api_key", "");
  tests::assertEq(empty.redact("unchanged"), "unchanged");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testExpand();
  trellis::testEscapes();
  trellis::testErrors();
  trellis::testLazy();
  trellis::testRedact();
}

#endif
