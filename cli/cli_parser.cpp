#include <cstdlib>

#include <CLI/CLI.hpp>
#include "cli_parser.hpp"
#include "../src/miscellaneous.hpp"

struct CliParser final {
  CliParser(const int argc, char **argv, const std::string &title) : argc_(argc), argv_(argv), app_(title) {}

  [[nodiscard]]
  const ParserSettings &parse();

private:
  int argc_;
  char **argv_;
  CLI::App app_;
  ParserSettings parser_settings_{};
};

const ParserSettings &CliParser::parse() {
  parser_settings_.fen = std::string(start_position);

  app_.add_option("-f,--fen", parser_settings_.fen, "The position to run perft on")->capture_default_str();
  app_.add_option("-d,--depth", parser_settings_.depth, "Perft depth")->check(CLI::Range(1, 10))->capture_default_str();
  auto *const divide_option = app_.add_flag("--divide", parser_settings_.divide, "Print the node count below every root move");
  auto *const stats_option  = app_.add_flag("--stats", parser_settings_.stats, "Print captures, en passants, castles, promotions, checks and checkmates");
  app_.add_flag("-v,--verbose", parser_settings_.verbose, "Log at debug level");

  divide_option->excludes(stats_option);

  try
  { app_.parse(argc_, argv_); } catch (const CLI::ParseError &e)
  { std::exit(cli::exit_status(app_.exit(e))); }

  return parser_settings_;
}

namespace cli {

std::unique_ptr<ParserSettings> make_parser(const int argc, char **argv, const std::string &title) {
  return std::make_unique<ParserSettings>(CliParser(argc, argv, title).parse());
}

int exit_status(const int cli_exit_code) {
  return cli_exit_code == static_cast<int>(CLI::ExitCodes::Success) ? EXIT_SUCCESS : EXIT_FAILURE;
}

}// namespace cli
