/*
  Lynx, a bitboard chess board core derived from Feliscatus
  Copyright (C) 2008-2016 Gunnar Harms (Bobcat author)
  Copyright (C) 2017      FireFather (Tomcat author)
  Copyright (C) 2020-2022 Rudy Alex Kohn

  Lynx is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Lynx is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "bitboard.hpp"
#include "board.hpp"
#include "perft.hpp"
#include "stopwatch.hpp"
#include "miscellaneous.hpp"
#include "../cli/cli_parser.hpp"

namespace
{

constexpr auto max_log_file_size = 1048576 * 5;
constexpr auto max_log_files     = 3;

std::shared_ptr<spdlog::logger> logger =
  spdlog::rotating_logger_mt("main_logger", "logs/main.txt", max_log_file_size, max_log_files);

void print_stats(const perft::PerftStats &stats)
{
  fmt::print("nodes      : {}\n", stats.nodes);
  fmt::print("captures   : {}\n", stats.captures);
  fmt::print("en passants: {}\n", stats.en_passants);
  fmt::print("castles    : {}\n", stats.castles);
  fmt::print("promotions : {}\n", stats.promotions);
  fmt::print("checks     : {}\n", stats.checks);
  fmt::print("checkmates : {}\n", stats.checkmates);
}

}   // namespace

int main(const int argc, char *argv[])
{
  const auto settings = cli::make_parser(argc, argv, "Lynx, bitboard perft");

  if (settings->verbose)
    spdlog::set_level(spdlog::level::debug);

  fmt::print("{}", misc::print_engine_info());

  bitboard::init();

  Board b;

  if (!b.set_fen(settings->fen))
  {
    logger->error("rejected fen '{}'", settings->fen);
    fmt::print(stderr, "invalid fen: {}\n", settings->fen);
    return 1;
  }

  logger->info("perft depth {} on {}", settings->depth, b.fen());

  fmt::print("{}\n", b.print());

  if (settings->divide)
  {
    perft::divide(&b, settings->depth);
    return 0;
  }

  if (settings->stats)
  {
    print_stats(perft::perft_stats(&b, settings->depth));
    return 0;
  }

  for (auto depth = 1; depth <= settings->depth; depth++)
  {
    Stopwatch sw;
    const auto nodes = perft::perft(&b, depth);
    const auto time  = sw.elapsed_milliseconds() + 1;
    fmt::print("depth {}: {} nodes, {} ms, {} nps\n", depth, nodes, time, nodes * 1000 / static_cast<std::uint64_t>(time));
  }

  return 0;
}
