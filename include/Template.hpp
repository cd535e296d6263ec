#pragma once

#include "Manifest.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

// Values for the `{name}` fields of an action template.  Copies share the
// cache of lazily computed values.
class PlaceholderMap {
public:
  using Producer = std::function<rs::Result<std::string>()>;

  PlaceholderMap& set(std::string key, std::string value);
  // `value` is replaced with `***` by redact().
  PlaceholderMap& setSecret(std::string key, std::string value);
  // `producer` runs at most once, on the first expansion that needs `key`.
  PlaceholderMap& setLazy(std::string key, Producer producer);

  bool contains(std::string_view key) const;
  rs::Result<std::string> get(std::string_view key) const;

  // `context` names the action in error messages.
  rs::Result<std::string> expand(std::string_view text,
                                 std::string_view context) const;
  rs::Result<std::vector<std::string>>
  expand(const CommandTemplate& tmpl, std::string_view context) const;

  std::string redact(std::string text) const;

private:
  struct LazyValue {
    Producer producer;
    std::optional<std::string> value;
  };
  struct Entry {
    std::shared_ptr<LazyValue> lazy;
    bool secret = false;
  };

  std::map<std::string, Entry, std::less<>> entries;
};

} // namespace trellis
