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

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>

#include "types.hpp"
#include "move.hpp"

struct Board;

enum MoveGenFlags
{
  LEGALMOVES
};

namespace MoveGen
{

template<MoveGenFlags Flags>
Move *generate(const Board *b, Move *moves);

}

// A simple array wrapper for storing the generated moves

template<MoveGenFlags Flags>
struct MoveList final : std::array<Move, MAX_MOVES>
{
  explicit MoveList(const Board *b)
    : std::array<Move, MAX_MOVES>({}), last_move(MoveGen::generate<Flags>(b, data())){};

  [[nodiscard]]
  const_iterator end() const
  {
    return last_move;
  }

  [[nodiscard]]
  std::size_t size() const
  {
    return std::distance(begin(), end());
  }

  [[nodiscard]]
  bool empty() const
  {
    return size() == 0;
  }

  [[nodiscard]]
  bool contains(const Move move) const
  {
    return std::find(begin(), end(), move) != end();
  }

private:
  const_iterator last_move;
};
