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

#pragma once

#include <cstdint>

struct Board;

namespace perft
{

struct PerftStats final
{
  std::uint64_t nodes{};
  std::uint64_t captures{};
  std::uint64_t en_passants{};
  std::uint64_t castles{};
  std::uint64_t promotions{};
  std::uint64_t checks{};
  std::uint64_t checkmates{};
};

/// perft() number of leaf nodes of the legal move tree, depth 0 counts the position itself
std::uint64_t perft(Board *b, int depth);

/// divide() prints the leaf count below every root move and returns their sum
std::uint64_t divide(Board *b, int depth);

/// perft_stats() move kind counts on the last ply, checks and checkmates on the leaves
PerftStats perft_stats(Board *b, int depth);

}   // namespace perft
