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

#include "moves.hpp"
#include "board.hpp"

namespace
{

[[nodiscard]]
Move *add_moves(const Board *b, const Square from, Bitboard attacks, Move *moves)
{
  while (attacks)
  {
    const auto to = pop_lsb(&attacks);
    const auto m  = init_move(from, to, b->piece(to) == NO_PIECE ? QUIET : CAPTURE);

    if (b->is_legal(m))
      *moves++ = m;
  }

  return moves;
}

template<Color Us, PieceType Pt>
[[nodiscard]]
Move *generate_piece_moves(const Board *b, const Bitboard targets, Move *moves)
{
  const auto occupied = b->pieces();
  auto bb             = b->pieces(Pt, Us);

  while (bb)
  {
    const auto from = pop_lsb(&bb);
    moves           = add_moves(b, from, piece_attacks_bb<Pt>(from, occupied) & targets, moves);
  }

  return moves;
}

[[nodiscard]]
Move *add_promotions(const Board *b, const Square from, const Square to, const bool capture, Move *moves)
{
  // the four promotions share the same legality
  if (!b->is_legal(init_move(from, to)))
    return moves;

  for (const auto pt : PromotionPieceTypes)
    *moves++ = init_move(from, to, promotion_flag(pt, capture));

  return moves;
}

template<Color Us>
[[nodiscard]]
Move *generate_pawn_moves(const Board *b, const Bitboard targets, Move *moves)
{
  constexpr auto Them  = ~Us;
  constexpr auto Up    = pawn_push(Us);
  constexpr auto Rank3 = rank_3[Us];
  constexpr auto Rank7 = rank_7[Us];

  const auto empty_squares = ~b->pieces();
  const auto enemies       = b->pieces(Them) & targets;
  const auto pawns         = b->pieces(PAWN, Us);
  const auto non_promotion = pawns & ~Rank7;

  auto single_push = shift_bb<Up>(non_promotion) & empty_squares;
  auto double_push = shift_bb<Up>(single_push & Rank3) & empty_squares & targets;

  single_push &= targets;

  while (single_push)
  {
    const auto to = pop_lsb(&single_push);
    const auto m  = init_move(to - Up, to);
    if (b->is_legal(m))
      *moves++ = m;
  }

  while (double_push)
  {
    const auto to = pop_lsb(&double_push);
    const auto m  = init_move(to - Up - Up, to, DOUBLE_PUSH);
    if (b->is_legal(m))
      *moves++ = m;
  }

  auto bb = non_promotion;

  while (bb)
  {
    const auto from = pop_lsb(&bb);
    auto captures   = pawn_attacks_bb(Us, from) & enemies;

    while (captures)
    {
      const auto m = init_move(from, pop_lsb(&captures), CAPTURE);
      if (b->is_legal(m))
        *moves++ = m;
    }
  }

  bb = pawns & Rank7;

  while (bb)
  {
    const auto from = pop_lsb(&bb);
    const auto push = from + Up;

    if (empty_squares & targets & push)
      moves = add_promotions(b, from, push, false, moves);

    auto captures = pawn_attacks_bb(Us, from) & enemies;

    while (captures)
      moves = add_promotions(b, from, pop_lsb(&captures), true, moves);
  }

  // en passant may resolve a check from the captured pawn, so it ignores targets
  if (const auto ep = b->en_passant_square(); ep != NO_SQ)
  {
    auto attackers = pawn_attacks_bb(Them, ep) & non_promotion;

    while (attackers)
    {
      const auto from = pop_lsb(&attackers);
      if (b->is_legal_ep(from))
        *moves++ = init_move(from, ep, EP_CAPTURE);
    }
  }

  return moves;
}

template<Color Us>
[[nodiscard]]
Move *generate_king_moves(const Board *b, Move *moves)
{
  const auto ksq = b->king_sq(Us);
  auto attacks   = piece_attacks_bb<KING>(ksq) & ~b->pieces(Us);

  while (attacks)
  {
    const auto to = pop_lsb(&attacks);
    if (b->is_legal_king_move(ksq, to))
      *moves++ = init_move(ksq, to, b->piece(to) == NO_PIECE ? QUIET : CAPTURE);
  }

  return moves;
}

template<Color Us>
[[nodiscard]]
Move *generate_castle_moves(const Board *b, Move *moves)
{
  constexpr auto KingSide  = make_castling<Us, KING_SIDE>();
  constexpr auto QueenSide = make_castling<Us, QUEEN_SIDE>();

  const auto ksq = b->king_sq(Us);

  if (b->can_castle_move(KingSide))
    *moves++ = init_move(ksq, oo_king_to[Us], KING_CASTLE);

  if (b->can_castle_move(QueenSide))
    *moves++ = init_move(ksq, ooo_king_to[Us], QUEEN_CASTLE);

  return moves;
}

template<Color Us>
[[nodiscard]]
Move *generate_legal(const Board *b, Move *moves)
{
  moves = generate_king_moves<Us>(b, moves);

  const auto checkers = b->checkers();

  // only the king can answer a double check
  if (more_than_one(checkers))
    return moves;

  const auto targets = checkers ? between(b->king_sq(Us), lsb(checkers)) | checkers : ~b->pieces(Us);

  moves = generate_pawn_moves<Us>(b, targets, moves);
  moves = generate_piece_moves<Us, KNIGHT>(b, targets, moves);
  moves = generate_piece_moves<Us, BISHOP>(b, targets, moves);
  moves = generate_piece_moves<Us, ROOK>(b, targets, moves);
  moves = generate_piece_moves<Us, QUEEN>(b, targets, moves);

  if (!checkers)
    moves = generate_castle_moves<Us>(b, moves);

  return moves;
}

}   // namespace

namespace MoveGen
{

template<MoveGenFlags Flags>
Move *generate(const Board *b, Move *moves)
{
  static_assert(Flags == LEGALMOVES);

  return b->side_to_move() == WHITE ? generate_legal<WHITE>(b, moves) : generate_legal<BLACK>(b, moves);
}

template Move *generate<LEGALMOVES>(const Board *, Move *);

}   // namespace MoveGen
