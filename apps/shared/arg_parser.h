#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace lexcite::apps {

// Exit codes shared by every subcommand.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false to reject the value; it reports why on stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;
  std::vector<std::string> positionals;
  bool ok{true};  // false after any unknown flag, missing value or rejected value
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler and collects everything else that is not flag-like as a
// positional argument. A lone "-" counts as positional. Problems are
// reported to stderr and clear ParsedArgs::ok; parsing continues so every
// problem is reported at once.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (!opt->requires_value) {
        parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      } else if (i + 1 < argc) {
        parsed.ok = opt->handler(parsed.config,
                                 argv[++i])  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                    && parsed.ok;
      } else {
        std::cerr << "Option " << arg << " requires a value\n";
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

}  // namespace lexcite::apps
