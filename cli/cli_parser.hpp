#pragma once

#include <memory>
#include <string>

struct ParserSettings {
  std::string fen{};
  int depth{5};
  bool divide{};
  bool stats{};
  bool verbose{};
};

namespace cli {

std::unique_ptr<ParserSettings> make_parser(int argc, char **argv, const std::string &title);

/// Process exit status for a CLI11 exit code, 0 for help requests and 1 for any parse error
[[nodiscard]]
int exit_status(int cli_exit_code);

}
