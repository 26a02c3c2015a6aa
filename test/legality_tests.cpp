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

#define CATCH_CONFIG_MAIN

#include <algorithm>

#include <catch2/catch.hpp>

#include "../src/bitboard.hpp"
#include "../src/board.hpp"
#include "../src/moves.hpp"

namespace
{

[[nodiscard]]
bool any_move_from(const MoveList<LEGALMOVES> &moves, const Square from)
{
  return std::any_of(moves.begin(), moves.end(), [&from](const Move m) {
    return move_from(m) == from;
  });
}

}   // namespace

TEST_CASE("Bishop pinned on a file can not move", "[pin_file]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen("4r1k1/8/8/8/8/8/4B3/4K3 w - - 0 1"));

  REQUIRE(b.pinned(WHITE) == bit(E2));
  REQUIRE(b.pinned(BLACK) == ZeroBB);

  REQUIRE_FALSE(b.is_legal(init_move(E2, D3)));
  REQUIRE_FALSE(b.is_legal(init_move(E2, F1)));

  const MoveList<LEGALMOVES> moves(&b);
  REQUIRE_FALSE(any_move_from(moves, E2));
  REQUIRE(any_move_from(moves, E1));
}

TEST_CASE("Rook pinned on a file moves along it", "[pin_along]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen("4r1k1/8/8/8/8/8/4R3/4K3 w - - 0 1"));

  REQUIRE(b.pinned(WHITE) == bit(E2));

  REQUIRE(b.is_legal(init_move(E2, E5)));
  REQUIRE(b.is_legal(init_move(E2, E8, CAPTURE)));
  REQUIRE_FALSE(b.is_legal(init_move(E2, D2)));
  REQUIRE_FALSE(b.is_legal(init_move(E2, H2)));

  const MoveList<LEGALMOVES> moves(&b);
  REQUIRE(moves.contains(init_move(E2, E8, CAPTURE)));
  REQUIRE(moves.contains(init_move(E2, E3)));
  REQUIRE_FALSE(moves.contains(init_move(E2, A2)));
}

TEST_CASE("Diagonal pin", "[pin_diagonal]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen("6k1/8/8/8/q7/8/2B5/3K4 w - - 0 1"));

  REQUIRE(b.pinned(WHITE) == bit(C2));

  REQUIRE(b.is_legal(init_move(C2, B3)));
  REQUIRE(b.is_legal(init_move(C2, A4, CAPTURE)));
  REQUIRE_FALSE(b.is_legal(init_move(C2, D3)));
  REQUIRE_FALSE(b.is_legal(init_move(C2, B1)));
}

TEST_CASE("Pins need exactly one piece in between", "[pin_count]")
{
  bitboard::init();

  Board b{};

  SECTION("Two own pieces")
  {
    REQUIRE(b.set_fen("4r1k1/8/8/8/4N3/8/4B3/4K3 w - - 0 1"));
    REQUIRE(b.pinned(WHITE) == ZeroBB);
  }

  SECTION("Enemy piece in between")
  {
    REQUIRE(b.set_fen("4r1k1/8/8/8/4n3/8/4B3/4K3 w - - 0 1"));
    REQUIRE(b.pinned(WHITE) == ZeroBB);
  }

  SECTION("Black pieces are tracked too")
  {
    REQUIRE(b.set_fen("4k3/4n3/8/8/8/8/8/4RK2 w - - 0 1"));
    REQUIRE(b.pinned(BLACK) == bit(E7));
    REQUIRE(b.pinned(WHITE) == ZeroBB);
  }

  SECTION("A knight is not a pinner")
  {
    REQUIRE(b.set_fen("6k1/8/8/4n3/8/8/4B3/4K3 w - - 0 1"));
    REQUIRE(b.pinned(WHITE) == ZeroBB);
  }
}

TEST_CASE("Check detection", "[checkers]")
{
  bitboard::init();

  Board b{};

  SECTION("Rook on the king's rank")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/r3K3 w - - 0 1"));
    REQUIRE(b.in_check());
    REQUIRE(b.checkers() == bit(A1));
  }

  SECTION("A blocker removes the check and is pinned")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/r1N1K3 w - - 0 1"));
    REQUIRE_FALSE(b.in_check());
    REQUIRE(b.checkers() == ZeroBB);
    REQUIRE(b.pinned(WHITE) == bit(C1));
  }

  SECTION("Checks are recomputed after a move")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/r1N1K3 b - - 0 1"));
    REQUIRE_FALSE(b.in_check());

    const auto m    = init_move(E8, E7);
    const auto undo = b.make_move(m);

    REQUIRE_FALSE(b.in_check());
    REQUIRE(b.pinned(WHITE) == bit(C1));

    b.unmake_move(m, undo);
    REQUIRE(b.side_to_move() == BLACK);
  }

  SECTION("Pawn and knight checks")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/5n2/3p4/4K3 w - - 0 1"));
    REQUIRE(b.checkers() == bit(D2, F3));
  }
}

TEST_CASE("King moves", "[king_moves]")
{
  bitboard::init();

  Board b{};

  SECTION("The king can not retreat along the checking ray")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/r3K3 w - - 0 1"));

    const MoveList<LEGALMOVES> moves(&b);

    REQUIRE_FALSE(b.is_legal_king_move(E1, F1));
    REQUIRE_FALSE(moves.contains(init_move(E1, F1)));
    REQUIRE_FALSE(moves.contains(init_move(E1, D1)));
    REQUIRE(moves.contains(init_move(E1, D2)));
    REQUIRE(moves.contains(init_move(E1, E2)));
    REQUIRE(moves.contains(init_move(E1, F2)));
    REQUIRE(moves.size() == 3);
  }

  SECTION("Capturing a defended piece is illegal")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/3p4/4p3/4K3 w - - 0 1"));

    REQUIRE_FALSE(b.is_legal_king_move(E1, E2));
    REQUIRE(b.is_legal_king_move(E1, D2));
  }
}

TEST_CASE("Evasions", "[evasions]")
{
  bitboard::init();

  Board b{};

  SECTION("Double check allows king moves only")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/5n2/3Q4/r3K3 w - - 0 1"));
    REQUIRE(b.checkers() == bit(A1, F3));

    const MoveList<LEGALMOVES> moves(&b);

    REQUIRE(moves.size() == 2);
    REQUIRE(moves.contains(init_move(E1, E2)));
    REQUIRE(moves.contains(init_move(E1, F2)));
  }

  SECTION("Single check is blocked or the checker captured")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/1R6/r3K3 w - - 0 1"));

    const MoveList<LEGALMOVES> moves(&b);

    REQUIRE(moves.contains(init_move(B2, B1)));
    REQUIRE_FALSE(moves.contains(init_move(B2, B3)));
    REQUIRE_FALSE(moves.contains(init_move(B2, A2)));
    REQUIRE(std::count_if(moves.begin(), moves.end(), [](const Move m) { return move_from(m) == B2; }) == 1);
  }

  SECTION("Checkmate leaves no moves")
  {
    REQUIRE(b.set_fen("rnb1kbnr/pppp1ppp/8/4p3/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 1 3"));
    REQUIRE(b.in_check());

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE(moves.empty());
  }

  SECTION("Stalemate leaves no moves without check")
  {
    REQUIRE(b.set_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    REQUIRE_FALSE(b.in_check());

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE(moves.empty());
  }
}

TEST_CASE("En passant legality", "[en_passant_legal]")
{
  bitboard::init();

  Board b{};

  SECTION("Capture exposing the king on the rank is illegal")
  {
    REQUIRE(b.set_fen("8/8/8/K2pP2r/8/8/8/7k w - d6 0 1"));
    REQUIRE(b.en_passant_square() == D6);

    REQUIRE_FALSE(b.is_legal_ep(E5));

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE_FALSE(moves.contains(init_move(E5, D6, EP_CAPTURE)));
    REQUIRE(moves.contains(init_move(E5, E6)));
  }

  SECTION("Capture removing the checking pawn is legal")
  {
    REQUIRE(b.set_fen("8/8/8/2k5/3Pp3/8/8/4K3 b - d3 0 1"));
    REQUIRE(b.checkers() == bit(D4));

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE(moves.contains(init_move(E4, D3, EP_CAPTURE)));
    REQUIRE_FALSE(moves.contains(init_move(E4, E3)));
  }

  SECTION("Ordinary en passant")
  {
    REQUIRE(b.set_fen("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3"));
    REQUIRE(b.is_legal_ep(E5));

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE(moves.contains(init_move(E5, F6, EP_CAPTURE)));
    REQUIRE_FALSE(moves.contains(init_move(E5, D6, EP_CAPTURE)));
  }
}

TEST_CASE("Castling legality", "[castle_legal]")
{
  bitboard::init();

  Board b{};

  SECTION("Both sides free")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    REQUIRE(b.can_castle_move(WHITE_OO));
    REQUIRE(b.can_castle_move(WHITE_OOO));

    const MoveList<LEGALMOVES> moves(&b);
    REQUIRE(moves.contains(init_move(E1, G1, KING_CASTLE)));
    REQUIRE(moves.contains(init_move(E1, C1, QUEEN_CASTLE)));
  }

  SECTION("The king may not cross an attacked square")
  {
    REQUIRE(b.set_fen("r3kr2/8/8/8/8/8/8/R3K2R w KQq - 0 1"));
    REQUIRE_FALSE(b.can_castle_move(WHITE_OO));
    REQUIRE(b.can_castle_move(WHITE_OOO));
  }

  SECTION("An attacked rook path square does not matter")
  {
    REQUIRE(b.set_fen("1r2k3/8/8/8/8/8/8/R3K2R w KQ - 0 1"));
    REQUIRE(b.can_castle_move(WHITE_OOO));
  }

  SECTION("Pieces between king and rook")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1"));
    REQUIRE_FALSE(b.can_castle_move(WHITE_OOO));
    REQUIRE(b.can_castle_move(WHITE_OO));
  }

  SECTION("Not out of check")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/4r3/R3K2R w KQk - 0 1"));
    REQUIRE(b.in_check());
    REQUIRE_FALSE(b.can_castle_move(WHITE_OO));
    REQUIRE_FALSE(b.can_castle_move(WHITE_OOO));
  }

  SECTION("No right")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/8/R3K2R w Kkq - 0 1"));
    REQUIRE_FALSE(b.can_castle_move(WHITE_OOO));
  }
}
