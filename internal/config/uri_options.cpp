#include "internal/config/uri_options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <vector>

#include "internal/config/driver_config.hpp"
#include "internal/util/errors.hpp"

namespace migrate::config {

namespace {

std::string PercentDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
      int value = 0;
      std::from_chars(in.data() + i + 1, in.data() + i + 3, value, 16);
      out.push_back(static_cast<char>(value));
      i += 2;
      continue;
    }
    out.push_back(in[i]);
  }
  return out;
}

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ParseBool(const std::string& key, const std::string& value) {
  const auto v = Lower(value);
  if (v == "1" || v == "t" || v == "true") {
    return true;
  }
  if (v == "0" || v == "f" || v == "false") {
    return false;
  }
  throw util::ConfigError("option " + key + " expects a boolean, got '" + value + "'");
}

std::uint32_t ParseSeconds(const std::string& key, const std::string& value) {
  std::uint32_t seconds = 0;
  auto [ptr, ec]        = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc{} || ptr != value.data() + value.size() || seconds == 0) {
    throw util::ConfigError("option " + key + " expects a positive number of seconds, got '" + value + "'");
  }
  return seconds;
}

std::vector<std::string_view> Split(std::string_view in, char sep) {
  std::vector<std::string_view> parts;
  while (true) {
    auto pos = in.find(sep);
    parts.push_back(in.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    in.remove_prefix(pos + 1);
  }
  return parts;
}

void ApplyOption(DriverConfig& config, const std::string& key, const std::string& value) {
  if (key == "x-migrations-collection") {
    config.set_migrations_collection(value);
  } else if (key == "x-transaction-mode") {
    config.set_transaction_mode(ParseBool(key, value));
  } else if (key == "x-advisory-locking") {
    config.mutable_locking()->set_enabled(ParseBool(key, value));
  } else if (key == "x-advisory-lock-collection") {
    config.mutable_locking()->set_collection(value);
  } else if (key == "x-advisory-lock-timeout") {
    config.mutable_locking()->set_timeout_seconds(ParseSeconds(key, value));
  } else {
    throw util::ConfigError("unknown option " + key);
  }
}

} // namespace

ParsedUri ParseConnectionUri(const std::string& uri) {
  const std::string_view view(uri);

  const auto scheme_end = view.find("://");
  if (scheme_end == std::string_view::npos) {
    throw util::ConfigError("invalid connection URI: missing scheme");
  }
  const auto scheme = view.substr(0, scheme_end);
  if (scheme != "mongodb" && scheme != "mongodb+srv") {
    throw util::ConfigError("invalid connection URI: unsupported scheme '" + std::string(scheme) + "'");
  }

  const auto query_start = view.find('?', scheme_end + 3);
  const auto base        = view.substr(0, query_start);
  const auto query       = query_start == std::string_view::npos ? std::string_view{} : view.substr(query_start + 1);

  ParsedUri parsed;

  const auto path_start = base.find('/', scheme_end + 3);
  if (path_start != std::string_view::npos) {
    parsed.config.set_database_name(PercentDecode(base.substr(path_start + 1)));
  }

  std::vector<std::string> kept;
  if (!query.empty()) {
    for (auto pair : Split(query, '&')) {
      if (pair.empty()) {
        continue;
      }
      const auto eq    = pair.find('=');
      const auto key   = std::string(pair.substr(0, eq));
      const auto value = eq == std::string_view::npos ? std::string{} : PercentDecode(pair.substr(eq + 1));

      if (key.rfind("x-", 0) == 0) {
        ApplyOption(parsed.config, key, value);
        continue;
      }
      if (Lower(key) == "connect" && (Lower(value) == "single" || Lower(value) == "direct")) {
        kept.emplace_back("directConnection=true");
        continue;
      }
      kept.emplace_back(pair);
    }
  }

  parsed.driver_uri = std::string(base);
  for (std::size_t i = 0; i < kept.size(); ++i) {
    parsed.driver_uri += (i == 0 ? '?' : '&');
    parsed.driver_uri += kept[i];
  }

  ApplyDefaults(parsed.config);
  Validate(parsed.config);
  return parsed;
}

} // namespace migrate::config
