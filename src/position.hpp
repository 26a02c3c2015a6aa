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

#include <array>

#include "types.hpp"

/// the irreversible part of the board state, plus the derived check information for the side to move
struct Position final
{
  void clear();

  [[nodiscard]]
  bool can_castle() const;

  [[nodiscard]]
  bool can_castle(CastlingRight cr) const;

  bool operator==(const Position &other) const = default;

  Color side_to_move{WHITE};
  int castle_rights{};
  Square en_passant_square{NO_SQ};
  int rule50{};
  int ply{};
  Bitboard checkers{};
  std::array<Bitboard, COL_NB> pinned{};
};

inline bool Position::can_castle() const
{
  return castle_rights != NO_CASTLING;
}

inline bool Position::can_castle(const CastlingRight cr) const
{
  return castle_rights & cr;
}
