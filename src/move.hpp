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
#include <string>

#include <fmt/format.h>

#include "types.hpp"

// 16 bit move: bits 0-5 from, 6-11 to, 12-15 flag

enum Move : std::uint16_t
{
  MOVE_NONE
};

enum MoveFlag : int
{
  QUIET             = 0,
  DOUBLE_PUSH       = 1,
  KING_CASTLE       = 2,
  QUEEN_CASTLE      = 3,
  CAPTURE           = 4,
  EP_CAPTURE        = 5,
  PROMOTION         = 8,
  KNIGHT_PROMOTION  = PROMOTION,
  BISHOP_PROMOTION  = PROMOTION | 1,
  ROOK_PROMOTION    = PROMOTION | 2,
  QUEEN_PROMOTION   = PROMOTION | 3,
  KNIGHT_PROMO_CAPTURE = PROMOTION | CAPTURE,
  BISHOP_PROMO_CAPTURE = PROMOTION | CAPTURE | 1,
  ROOK_PROMO_CAPTURE   = PROMOTION | CAPTURE | 2,
  QUEEN_PROMO_CAPTURE  = PROMOTION | CAPTURE | 3
};

[[nodiscard]]
constexpr Square move_from(const Move m)
{
  return static_cast<Square>(m & 63);
}

[[nodiscard]]
constexpr Square move_to(const Move m)
{
  return static_cast<Square>((m >> 6) & 63);
}

[[nodiscard]]
constexpr MoveFlag move_flag(const Move m)
{
  return static_cast<MoveFlag>((m >> 12) & 15);
}

[[nodiscard]]
constexpr bool is_capture(const Move m)
{
  return move_flag(m) & CAPTURE;
}

[[nodiscard]]
constexpr bool is_ep_capture(const Move m)
{
  return move_flag(m) == EP_CAPTURE;
}

[[nodiscard]]
constexpr bool is_promotion(const Move m)
{
  return move_flag(m) & PROMOTION;
}

[[nodiscard]]
constexpr bool is_castle_move(const Move m)
{
  const auto flag = move_flag(m);
  return flag == KING_CASTLE || flag == QUEEN_CASTLE;
}

[[nodiscard]]
constexpr bool is_double_push(const Move m)
{
  return move_flag(m) == DOUBLE_PUSH;
}

/// promotion_type() only meaningful for promotion moves
[[nodiscard]]
constexpr PieceType promotion_type(const Move m)
{
  return static_cast<PieceType>(KNIGHT + (move_flag(m) & 3));
}

[[nodiscard]]
constexpr MoveFlag promotion_flag(const PieceType pt, const bool capture)
{
  return static_cast<MoveFlag>(PROMOTION | (capture ? CAPTURE : 0) | (pt - KNIGHT));
}

[[nodiscard]]
constexpr Move init_move(const Square from, const Square to, const MoveFlag flag = QUIET)
{
  return static_cast<Move>(from | (to << 6) | (flag << 12));
}

/// move_to_string() long algebraic notation, e.g. "e2e4", "e7e8q" or "0000" for no move
[[nodiscard]]
inline std::string move_to_string(const Move m)
{
  if (m == MOVE_NONE)
    return "0000";

  if (is_promotion(m))
    return fmt::format("{}{}{}", square_to_string(move_from(m)), square_to_string(move_to(m)), piece_index[promotion_type(m)]);

  return fmt::format("{}{}", square_to_string(move_from(m)), square_to_string(move_to(m)));
}
