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

#include <algorithm>
#include <cassert>
#include <cctype>
#include <limits>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "board.hpp"
#include "moves.hpp"
#include "util.hpp"

namespace
{

constexpr auto max_log_file_size = 1048576 * 5;
constexpr auto max_log_files     = 3;
constexpr auto max_fullmove      = std::numeric_limits<int>::max() / 2;

std::shared_ptr<spdlog::logger> logger =
  spdlog::rotating_logger_mt("fen_logger", "logs/fen.txt", max_log_file_size, max_log_files);

/// rights lost when a piece leaves or lands on the square, zero away from the king and rook home squares
consteval std::array<int, SQ_NB> make_castle_rights_mask()
{
  std::array<int, SQ_NB> result{};
  result[A1] = WHITE_OOO;
  result[H1] = WHITE_OO;
  result[E1] = WHITE_ANY;
  result[A8] = BLACK_OOO;
  result[H8] = BLACK_OO;
  result[E8] = BLACK_ANY;
  return result;
}

constexpr std::array<int, SQ_NB> castle_rights_mask = make_castle_rights_mask();

struct CastleSquares final
{
  CastlingRight right;
  Square king_from;
  Square king_to;
  Square rook_from;
  Square rook_to;
  char letter;
};

constexpr std::array<CastleSquares, 4> castle_squares{{{WHITE_OO, E1, G1, H1, F1, 'K'},
                                                       {WHITE_OOO, E1, C1, A1, D1, 'Q'},
                                                       {BLACK_OO, E8, G8, H8, F8, 'k'},
                                                       {BLACK_OOO, E8, C8, A8, D8, 'q'}}};

[[nodiscard]]
constexpr const CastleSquares &castle_data(const Color us, const bool king_side)
{
  return castle_squares[us * 2 + (king_side ? 0 : 1)];
}

[[nodiscard]]
std::vector<std::string_view> split_fields(std::string_view fen)
{
  constexpr auto splitter = ' ';

  std::vector<std::string_view> fields;

  while (!fen.empty())
  {
    const auto start = fen.find_first_not_of(splitter);
    if (start == std::string_view::npos)
      break;

    fen.remove_prefix(start);

    const auto space = fen.find_first_of(splitter);
    fields.emplace_back(fen.substr(0, space));

    if (space == std::string_view::npos)
      break;

    fen.remove_prefix(space);
  }

  return fields;
}

}   // namespace

Board::Board()
{
  clear();
}

Board::Board(const std::string_view fen) : Board()
{
  if (!set_fen(fen))
    logger->warn("board constructed from invalid fen '{}', left empty", fen);
}

void Board::clear()
{
  occupied_by_side.fill(ZeroBB);
  occupied_by_type.fill(ZeroBB);
  board.fill(NO_PIECE);
  king_square.fill(NO_SQ);
  pos.clear();
}

UndoRecord Board::make_move(const Move m)
{
  assert(m != MOVE_NONE);

  const auto from = move_from(m);
  const auto to   = move_to(m);
  const auto us   = pos.side_to_move;
  const auto pc   = board[from];

  assert(pc != NO_PIECE && color_of(pc) == us);

  UndoRecord undo{NO_PT, pos.castle_rights, pos.en_passant_square, pos.rule50};

  if (type_of(pc) == KING)
    pos.castle_rights &= ~(us & ANY_CASTLING);

  if (is_ep_capture(m))
  {
    const auto cap_sq = to - pawn_push(us);
    assert(board[cap_sq] == make_piece(PAWN, ~us));
    remove_piece(cap_sq);
    undo.captured = PAWN;
  } else if (is_capture(m))
  {
    undo.captured = type_of(board[to]);
    assert(board[to] != NO_PIECE && color_of(board[to]) != us && undo.captured != KING);
    remove_piece(to);
  }

  pos.en_passant_square = NO_SQ;

  if (is_double_push(m))
    pos.en_passant_square = to - pawn_push(us);

  if (is_castle_move(m))
  {
    const auto &cs = castle_data(us, move_flag(m) == KING_CASTLE);
    assert(board[cs.rook_from] == make_piece(ROOK, us));
    move_piece(cs.rook_from, cs.rook_to);
  }

  remove_piece(from);
  add_piece(is_promotion(m) ? make_piece(promotion_type(m), us) : pc, to);

  pos.castle_rights &= ~(castle_rights_mask[from] | castle_rights_mask[to]);
  pos.rule50 = type_of(pc) == PAWN || undo.captured != NO_PT ? 0 : pos.rule50 + 1;

  pos.side_to_move = ~us;
  ++pos.ply;

  update_check_info();

  assert(is_ok());

  return undo;
}

void Board::unmake_move(const Move m, const UndoRecord &undo)
{
  const auto from = move_from(m);
  const auto to   = move_to(m);

  pos.side_to_move = ~pos.side_to_move;
  --pos.ply;

  const auto us = pos.side_to_move;

  assert(board[to] != NO_PIECE && color_of(board[to]) == us);
  assert(board[from] == NO_PIECE);

  if (is_promotion(m))
  {
    remove_piece(to);
    add_piece(make_piece(PAWN, us), from);
  } else if (is_castle_move(m))
  {
    const auto &cs = castle_data(us, move_flag(m) == KING_CASTLE);
    move_piece(to, from);
    move_piece(cs.rook_to, cs.rook_from);
  } else
    move_piece(to, from);

  if (undo.captured != NO_PT)
  {
    assert(is_capture(m));
    const auto cap_sq = is_ep_capture(m) ? to - pawn_push(us) : to;
    add_piece(make_piece(undo.captured, ~us), cap_sq);
  }

  pos.castle_rights     = undo.castle_rights;
  pos.en_passant_square = undo.en_passant_square;
  pos.rule50            = undo.rule50;

  update_check_info();

  assert(is_ok());
}

bool Board::is_legal(const Move m) const
{
  const auto from = move_from(m);
  const auto us   = pos.side_to_move;

  assert(type_of(board[from]) != KING);

  return !(pos.pinned[us] & from) || aligned(from, move_to(m), king_sq(us));
}

bool Board::is_legal_king_move(const Square from, const Square to) const
{
  const auto them = ~pos.side_to_move;
  return !(attackers_to(to, pieces() ^ from) & pieces(them));
}

bool Board::is_legal_ep(const Square from) const
{
  const auto us     = pos.side_to_move;
  const auto to     = pos.en_passant_square;
  const auto cap_sq = to - pawn_push(us);
  const auto occ    = (pieces() ^ from ^ cap_sq) | to;

  assert(to != NO_SQ);

  return !(attackers_to(king_sq(us), occ) & (pieces(~us) ^ cap_sq));
}

bool Board::can_castle_move(const CastlingRight cr) const
{
  const auto us = pos.side_to_move;

  if (!can_castle(cr) || in_check())
    return false;

  const auto &cs = castle_data(us, cr & KING_SIDE);

  if (between(cs.king_from, cs.rook_from) & pieces())
    return false;

  const auto them = ~us;
  const auto step = cs.king_to > cs.king_from ? EAST : WEST;

  for (auto s = cs.king_from + step;; s += step)
  {
    if (is_attacked(s, them))
      return false;
    if (s == cs.king_to)
      break;
  }

  return true;
}

Move Board::move_from_string(const std::string_view s) const
{
  const MoveList<LEGALMOVES> moves(this);

  for (const auto m : moves)
    if (move_to_string(m) == s)
      return m;

  return MOVE_NONE;
}

Bitboard Board::attackers_to(const Square s, const Bitboard occ) const
{
  return (pawn_attacks_bb(BLACK, s) & pieces(PAWN, WHITE)) | (pawn_attacks_bb(WHITE, s) & pieces(PAWN, BLACK))
         | (piece_attacks_bb<KNIGHT>(s) & pieces(KNIGHT)) | (piece_attacks_bb<BISHOP>(s, occ) & pieces(BISHOP, QUEEN))
         | (piece_attacks_bb<ROOK>(s, occ) & pieces(ROOK, QUEEN)) | (piece_attacks_bb<KING>(s) & pieces(KING));
}

Bitboard Board::pinned_pieces(const Color c, const Square s) const
{
  const auto them        = ~c;
  const auto all_pieces  = pieces();
  const auto side_pieces = pieces(c);
  auto pinners           = xray_attacks<BISHOP>(all_pieces, side_pieces, s) & pieces(BISHOP, QUEEN, them);
  auto pinned_pieces     = ZeroBB;

  while (pinners)
    pinned_pieces |= between(pop_lsb(&pinners), s) & side_pieces;

  pinners = xray_attacks<ROOK>(all_pieces, side_pieces, s) & pieces(ROOK, QUEEN, them);

  while (pinners)
    pinned_pieces |= between(pop_lsb(&pinners), s) & side_pieces;

  return pinned_pieces;
}

void Board::update_check_info()
{
  const auto us = pos.side_to_move;

  pos.checkers = attackers_to(king_sq(us)) & pieces(~us);

  for (const auto c : Colors)
    pos.pinned[c] = pinned_pieces(c, king_sq(c));
}

bool Board::is_ok() const
{
  auto all = ZeroBB;

  for (const auto sq : Squares)
  {
    const auto pc = board[sq];

    if (pc == NO_PIECE)
    {
      if (pieces() & sq)
        return false;
      continue;
    }

    if (!(pieces(pc) & sq))
      return false;

    all |= sq;
  }

  if (all != pieces() || (pieces(WHITE) & pieces(BLACK)) || (pieces(WHITE) | pieces(BLACK)) != pieces())
    return false;

  auto types = ZeroBB;

  for (const auto pt : PieceTypes)
  {
    if (types & pieces(pt))
      return false;
    types |= pieces(pt);
  }

  if (types != pieces())
    return false;

  for (const auto c : Colors)
    if (pop_count(pieces(KING, c)) != 1 || board[king_square[c]] != make_piece(KING, c))
      return false;

  for (const auto &cs : castle_squares)
  {
    if (!can_castle(cs.right))
      continue;

    const auto c = cs.right & WHITE_ANY ? WHITE : BLACK;
    if (board[cs.king_from] != make_piece(KING, c) || board[cs.rook_from] != make_piece(ROOK, c))
      return false;
  }

  if (const auto ep = pos.en_passant_square; ep != NO_SQ)
  {
    const auto us = pos.side_to_move;
    if (relative_rank(us, ep) != RANK_6 || board[ep] != NO_PIECE || board[ep + pawn_push(us)] != NO_PIECE
        || board[ep - pawn_push(us)] != make_piece(PAWN, ~us))
      return false;
  }

  const auto us = pos.side_to_move;

  if (pos.checkers != (attackers_to(king_sq(us)) & pieces(~us)))
    return false;

  for (const auto c : Colors)
    if (pos.pinned[c] != pinned_pieces(c, king_sq(c)))
      return false;

  // the side which just moved can not be left in check
  return !is_attacked(king_sq(~us), us);
}

bool Board::set_fen(const std::string_view fen)
{
  clear();

  const auto fail = [this, &fen](const std::string_view reason) {
    logger->error("invalid fen '{}': {}", fen, reason);
    clear();
    return false;
  };

  const auto fields = split_fields(fen);

  if (fields.size() < 4)
    return fail("expected at least 4 fields");

  // Piece placement
  auto rank = static_cast<int>(RANK_8);
  auto file = static_cast<int>(FILE_A);

  for (const auto token : fields[0])
  {
    if (token == '/')
    {
      if (file != FILE_NB)
        return fail(fmt::format("rank {} does not have 8 squares", rank + 1));

      if (--rank < RANK_1)
        return fail("too many ranks");

      file = FILE_A;
    } else if (util::in_between<'1', '8'>(token))
    {
      file += util::from_char<int>(token);
      if (file > FILE_NB)
        return fail(fmt::format("rank {} overflows", rank + 1));
    } else if (const auto pc_idx = piece_index.find(static_cast<char>(std::tolower(static_cast<unsigned char>(token))));
               pc_idx != std::string_view::npos)
    {
      if (file >= FILE_NB)
        return fail(fmt::format("rank {} overflows", rank + 1));

      const auto pt = static_cast<PieceType>(pc_idx);
      const auto sq = make_square(static_cast<File>(file), static_cast<Rank>(rank));

      if (pt == PAWN && (rank == RANK_1 || rank == RANK_8))
        return fail(fmt::format("pawn on {}", square_to_string(sq)));

      add_piece(make_piece(pt, std::islower(static_cast<unsigned char>(token)) ? BLACK : WHITE), sq);
      ++file;
    } else
      return fail(fmt::format("unknown piece letter '{}'", token));
  }

  if (rank != RANK_1 || file != FILE_NB)
    return fail("expected 8 complete ranks");

  for (const auto c : Colors)
    if (pop_count(pieces(KING, c)) != 1)
      return fail(fmt::format("{} must have exactly one king", c == WHITE ? "white" : "black"));

  // Side to move
  if (fields[1] == "w")
    pos.side_to_move = WHITE;
  else if (fields[1] == "b")
    pos.side_to_move = BLACK;
  else
    return fail(fmt::format("bad side to move '{}'", fields[1]));

  if (!setup_castling(fields[2]))
    return fail(fmt::format("bad castling rights '{}'", fields[2]));

  if (!setup_en_passant(fields[3]))
    return fail(fmt::format("bad en passant square '{}'", fields[3]));

  // Move counters, both optional
  auto fullmove = 1;

  if (fields.size() > 4)
  {
    const auto rule50 = util::to_integral<int>(fields[4]);
    if (!rule50 || *rule50 < 0)
      return fail(fmt::format("bad half-move clock '{}'", fields[4]));
    pos.rule50 = *rule50;
  }

  if (fields.size() > 5)
  {
    const auto number = util::to_integral<int>(fields[5]);
    if (!number || *number < 0 || *number > max_fullmove)
      return fail(fmt::format("bad full-move number '{}'", fields[5]));
    fullmove = std::max(*number, 1);
  }

  if (fields.size() > 6)
    logger->warn("ignoring {} trailing fen field(s) after '{}'", fields.size() - 6, fields[5]);

  pos.ply = 2 * (fullmove - 1) + (pos.side_to_move == BLACK ? 1 : 0);

  if (is_attacked(king_sq(~pos.side_to_move), pos.side_to_move))
    return fail("the side not to move is in check");

  update_check_info();

  assert(is_ok());

  return true;
}

bool Board::setup_castling(const std::string_view s)
{
  pos.castle_rights = NO_CASTLING;

  if (s == "-")
    return true;

  for (const auto token : s)
  {
    const auto it = std::find_if(castle_squares.begin(), castle_squares.end(), [&token](const CastleSquares &cs) {
      return cs.letter == token;
    });

    if (it == castle_squares.end())
      return false;

    const auto c = std::isupper(static_cast<unsigned char>(token)) ? WHITE : BLACK;

    if (board[it->king_from] != make_piece(KING, c) || board[it->rook_from] != make_piece(ROOK, c))
    {
      logger->warn("castling right '{}' dropped, king or rook not on its home square", token);
      continue;
    }

    pos.castle_rights |= it->right;
  }

  return true;
}

bool Board::setup_en_passant(const std::string_view s)
{
  pos.en_passant_square = NO_SQ;

  if (s == "-")
    return true;

  if (s.size() != 2 || !util::in_between<'a', 'h'>(s[0]) || !(s[1] == '3' || s[1] == '6'))
    return false;

  const auto us = pos.side_to_move;
  const auto ep = make_square(static_cast<File>(s[0] - 'a'), static_cast<Rank>(s[1] - '1'));

  if (relative_rank(us, ep) != RANK_6 || board[ep] != NO_PIECE || board[ep + pawn_push(us)] != NO_PIECE
      || board[ep - pawn_push(us)] != make_piece(PAWN, ~us))
  {
    logger->warn("en passant square {} dropped, no double pushed pawn in front of it", s);
    return true;
  }

  pos.en_passant_square = ep;

  return true;
}

std::string Board::fen() const
{
  fmt::memory_buffer s;
  auto inserter = std::back_inserter(s);

  for (const Rank r : ReverseRanks)
  {
    auto empty = 0;

    for (const auto f : Files)
    {
      const auto sq = make_square(f, r);
      const auto pc = piece(sq);

      if (pc != NO_PIECE)
      {
        if (empty)
        {
          fmt::format_to(inserter, "{}", util::to_char(empty));
          empty = 0;
        }
        fmt::format_to(inserter, "{}", piece_letter[pc]);
      } else
        empty++;
    }

    if (empty)
      fmt::format_to(inserter, "{}", util::to_char(empty));

    if (r > RANK_1)
      fmt::format_to(inserter, "/");
  }

  fmt::format_to(inserter, " {} ", pos.side_to_move == WHITE ? 'w' : 'b');

  if (can_castle())
  {
    for (const auto &cs : castle_squares)
      if (can_castle(cs.right))
        fmt::format_to(inserter, "{}", cs.letter);
  } else
    fmt::format_to(inserter, "-");

  fmt::format_to(inserter, " {} {} {}", square_to_string(pos.en_passant_square), pos.rule50, pos.ply / 2 + 1);

  return fmt::to_string(s);
}

std::string Board::print() const
{
  fmt::memory_buffer s;
  auto inserter = std::back_inserter(s);

  fmt::format_to(inserter, "\n");

  for (const Rank rank : ReverseRanks)
  {
    fmt::format_to(inserter, "{}  ", rank + 1);

    for (const auto file : Files)
      fmt::format_to(inserter, "{} ", piece_letter[piece(make_square(file, rank))]);

    fmt::format_to(inserter, "\n");
  }

  fmt::format_to(inserter, "   a b c d e f g h\n\n{}\n", fen());

  return fmt::to_string(s);
}
