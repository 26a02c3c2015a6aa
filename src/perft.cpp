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

#include "perft.hpp"
#include "stopwatch.hpp"
#include "board.hpp"
#include "moves.hpp"

namespace
{

constexpr auto max_log_file_size = 1048576 * 5;
constexpr auto max_log_files     = 3;

std::shared_ptr<spdlog::logger> logger =
  spdlog::rotating_logger_mt("perft_logger", "logs/perft.txt", max_log_file_size, max_log_files);

template<MoveGenFlags Flags>
std::uint64_t p(Board *b, const int depth)
{
  if (depth == 0)
    return 1;

  const MoveList<Flags> ml(b);

  [[unlikely]]
  if (depth == 1)
    return ml.size();

  std::uint64_t nodes{};

  for (const auto m : ml)
  {
    const auto undo = b->make_move(m);
    nodes += p<Flags>(b, depth - 1);
    b->unmake_move(m, undo);
  }

  return nodes;
}

template<MoveGenFlags Flags>
void p_stats(Board *b, const int depth, perft::PerftStats &stats)
{
  const MoveList<Flags> ml(b);

  if (depth == 0)
  {
    stats.nodes++;

    if (b->in_check())
    {
      stats.checks++;
      if (ml.empty())
        stats.checkmates++;
    }

    return;
  }

  for (const auto m : ml)
  {
    if (depth == 1)
    {
      stats.captures += is_capture(m);
      stats.en_passants += is_ep_capture(m);
      stats.castles += is_castle_move(m);
      stats.promotions += is_promotion(m);
    }

    const auto undo = b->make_move(m);
    p_stats<Flags>(b, depth - 1, stats);
    b->unmake_move(m, undo);
  }
}

[[nodiscard]]
TimeUnit nps(const std::uint64_t nodes, const TimeUnit time)
{
  return static_cast<TimeUnit>(nodes * 1000 / static_cast<std::uint64_t>(time + 1));
}

}   // namespace

namespace perft
{

std::uint64_t perft(Board *b, const int depth)
{
  Stopwatch sw;

  const auto nodes = p<LEGALMOVES>(b, depth);
  const auto time  = sw.elapsed_milliseconds();

  logger->debug("perft {} depth {}: {} nodes, {} ms, {} nps", b->fen(), depth, nodes, time, nps(nodes, time));

  return nodes;
}

std::uint64_t divide(Board *b, const int depth)
{
  fmt::print("depth: {}\n", depth);

  std::uint64_t nodes{};
  Stopwatch sw;

  const MoveList<LEGALMOVES> ml(b);

  for (const auto m : ml)
  {
    const auto undo       = b->make_move(m);
    const auto move_nodes  = depth > 1 ? p<LEGALMOVES>(b, depth - 1) : 1;
    b->unmake_move(m, undo);

    nodes += move_nodes;
    fmt::print("{}: {}\n", move_to_string(m), move_nodes);
  }

  const auto time = sw.elapsed_milliseconds();

  fmt::print("\nmoves: {}\nnodes: {}\ntime : {} ms\nnps  : {}\n", ml.size(), nodes, time, nps(nodes, time));

  logger->info("divide {} depth {}: {} moves, {} nodes, {} ms", b->fen(), depth, ml.size(), nodes, time);

  return nodes;
}

PerftStats perft_stats(Board *b, const int depth)
{
  PerftStats stats{};
  Stopwatch sw;

  p_stats<LEGALMOVES>(b, depth, stats);

  logger->info("perft stats {} depth {}: {} nodes in {} ms", b->fen(), depth, stats.nodes, sw.elapsed_milliseconds());

  return stats;
}

}   // namespace perft
