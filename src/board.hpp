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
#include <string>
#include <string_view>

#include "types.hpp"
#include "bitboard.hpp"
#include "move.hpp"
#include "position.hpp"

/// state make_move() cannot recover from the move itself, handed back to unmake_move()
struct UndoRecord final
{
  PieceType captured{NO_PT};
  int castle_rights{};
  Square en_passant_square{NO_SQ};
  int rule50{};
};

struct Board final
{
  Board();

  explicit Board(std::string_view fen);

  void clear();

  [[nodiscard]]
  bool set_fen(std::string_view fen);

  [[nodiscard]]
  std::string fen() const;

  [[nodiscard]]
  std::string print() const;

  [[nodiscard]]
  UndoRecord make_move(Move m);

  void unmake_move(Move m, const UndoRecord &undo);

  [[nodiscard]]
  bool is_legal(Move m) const;

  [[nodiscard]]
  bool is_legal_king_move(Square from, Square to) const;

  [[nodiscard]]
  bool is_legal_ep(Square from) const;

  [[nodiscard]]
  bool can_castle_move(CastlingRight cr) const;

  [[nodiscard]]
  Move move_from_string(std::string_view s) const;

  [[nodiscard]]
  bool is_attacked(Square s, Color c) const;

  [[nodiscard]]
  Bitboard attackers_to(Square s, Bitboard occ) const;

  [[nodiscard]]
  Bitboard attackers_to(Square s) const;

  [[nodiscard]]
  Bitboard pinned_pieces(Color c, Square s) const;

  [[nodiscard]]
  Piece piece(Square s) const;

  [[nodiscard]]
  Bitboard pieces() const;

  [[nodiscard]]
  Bitboard pieces(Piece pc) const;

  [[nodiscard]]
  Bitboard pieces(PieceType pt) const;

  [[nodiscard]]
  Bitboard pieces(PieceType pt, PieceType pt2) const;

  [[nodiscard]]
  Bitboard pieces(PieceType pt, Color c) const;

  [[nodiscard]]
  Bitboard pieces(PieceType pt, PieceType pt2, Color c) const;

  [[nodiscard]]
  Bitboard pieces(Color c) const;

  [[nodiscard]]
  Square king_sq(Color c) const;

  [[nodiscard]]
  bool can_castle() const;

  [[nodiscard]]
  bool can_castle(CastlingRight cr) const;

  [[nodiscard]]
  int castle_rights() const;

  [[nodiscard]]
  Square en_passant_square() const;

  [[nodiscard]]
  Color side_to_move() const;

  [[nodiscard]]
  int ply() const;

  [[nodiscard]]
  int rule50() const;

  [[nodiscard]]
  Bitboard checkers() const;

  [[nodiscard]]
  bool in_check() const;

  [[nodiscard]]
  Bitboard pinned(Color c) const;

  [[nodiscard]]
  bool is_ok() const;

  bool operator==(const Board &other) const = default;

private:
  void add_piece(Piece pc, Square s);

  void remove_piece(Square s);

  void move_piece(Square from, Square to);

  void update_check_info();

  [[nodiscard]]
  bool setup_castling(std::string_view s);

  [[nodiscard]]
  bool setup_en_passant(std::string_view s);

  std::array<Piece, SQ_NB> board{};
  std::array<Bitboard, COL_NB> occupied_by_side{};
  std::array<Bitboard, PIECETYPE_NB> occupied_by_type{};
  std::array<Square, COL_NB> king_square{NO_SQ, NO_SQ};
  Position pos{};
};

inline void Board::add_piece(const Piece pc, const Square s)
{
  occupied_by_side[color_of(pc)] |= s;
  occupied_by_type[type_of(pc)] |= s;
  occupied_by_type[ALL_PIECE_TYPES] |= s;
  board[s] = pc;

  if (type_of(pc) == KING)
    king_square[color_of(pc)] = s;
}

inline void Board::remove_piece(const Square s)
{
  const auto pc = board[s];
  occupied_by_side[color_of(pc)] ^= s;
  occupied_by_type[type_of(pc)] ^= s;
  occupied_by_type[ALL_PIECE_TYPES] ^= s;
  board[s] = NO_PIECE;
}

inline void Board::move_piece(const Square from, const Square to)
{
  const auto pc = board[from];
  remove_piece(from);
  add_piece(pc, to);
}

inline Piece Board::piece(const Square s) const
{
  return board[s];
}

inline Bitboard Board::pieces() const
{
  return occupied_by_type[ALL_PIECE_TYPES];
}

inline Bitboard Board::pieces(const Piece pc) const
{
  return pieces(type_of(pc), color_of(pc));
}

inline Bitboard Board::pieces(const PieceType pt) const
{
  return occupied_by_type[pt];
}

inline Bitboard Board::pieces(const PieceType pt, const PieceType pt2) const
{
  return occupied_by_type[pt] | occupied_by_type[pt2];
}

inline Bitboard Board::pieces(const PieceType pt, const Color c) const
{
  return occupied_by_side[c] & occupied_by_type[pt];
}

inline Bitboard Board::pieces(const PieceType pt, const PieceType pt2, const Color c) const
{
  return occupied_by_side[c] & (occupied_by_type[pt] | occupied_by_type[pt2]);
}

inline Bitboard Board::pieces(const Color c) const
{
  return occupied_by_side[c];
}

inline Square Board::king_sq(const Color c) const
{
  return king_square[c];
}

inline bool Board::is_attacked(const Square s, const Color c) const
{
  return attackers_to(s) & pieces(c);
}

inline Bitboard Board::attackers_to(const Square s) const
{
  return attackers_to(s, pieces());
}

inline bool Board::can_castle() const
{
  return pos.can_castle();
}

inline bool Board::can_castle(const CastlingRight cr) const
{
  return pos.can_castle(cr);
}

inline int Board::castle_rights() const
{
  return pos.castle_rights;
}

inline Square Board::en_passant_square() const
{
  return pos.en_passant_square;
}

inline Color Board::side_to_move() const
{
  return pos.side_to_move;
}

inline int Board::ply() const
{
  return pos.ply;
}

inline int Board::rule50() const
{
  return pos.rule50;
}

inline Bitboard Board::checkers() const
{
  return pos.checkers;
}

inline bool Board::in_check() const
{
  return pos.checkers != ZeroBB;
}

inline Bitboard Board::pinned(const Color c) const
{
  return pos.pinned[c];
}
