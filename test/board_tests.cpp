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

#include <string_view>

#include <catch2/catch.hpp>

#include "../src/bitboard.hpp"
#include "../src/board.hpp"
#include "../src/moves.hpp"
#include "../src/miscellaneous.hpp"

namespace
{

constexpr std::string_view kiwipete = "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

constexpr std::string_view castle_position = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";

}   // namespace

TEST_CASE("Start position from fen", "[fen_start]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(start_position));

  REQUIRE(b.fen() == start_position);
  REQUIRE(b.side_to_move() == WHITE);
  REQUIRE(b.castle_rights() == ANY_CASTLING);
  REQUIRE(b.en_passant_square() == NO_SQ);
  REQUIRE(b.ply() == 0);
  REQUIRE(b.rule50() == 0);
  REQUIRE(b.king_sq(WHITE) == E1);
  REQUIRE(b.king_sq(BLACK) == E8);
  REQUIRE(b.piece(D8) == B_QUEEN);
  REQUIRE(pop_count(b.pieces(PAWN)) == 16);
  REQUIRE(pop_count(b.pieces()) == 32);
  REQUIRE_FALSE(b.in_check());
  REQUIRE(b.is_ok());
}

TEST_CASE("Fen round trip", "[fen_round_trip]")
{
  bitboard::init();

  constexpr std::array<std::string_view, 6> fens{
    kiwipete,
    castle_position,
    "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
    "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1",
    "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
    "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1"};

  for (const auto fen : fens)
  {
    Board b{};
    REQUIRE(b.set_fen(fen));
    REQUIRE(b.fen() == fen);
    REQUIRE(b.is_ok());

    Board copy{};
    REQUIRE(copy.set_fen(b.fen()));
    REQUIRE(copy == b);
  }
}

TEST_CASE("Fen counters", "[fen_counters]")
{
  bitboard::init();

  Board b{};

  SECTION("Black to move")
  {
    REQUIRE(b.set_fen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1"));
    REQUIRE(b.ply() == 1);
    REQUIRE(b.en_passant_square() == E3);
  }

  SECTION("Move counters")
  {
    REQUIRE(b.set_fen("r4rk1/1pp1qppp/p1np1n2/2b1p1B1/2B1P1b1/P1NP1N2/1PP1QPPP/R4RK1 w - - 3 10"));
    REQUIRE(b.ply() == 18);
    REQUIRE(b.rule50() == 3);
  }

  SECTION("Counters are optional")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/4K3 b - -"));
    REQUIRE(b.ply() == 1);
    REQUIRE(b.rule50() == 0);
    REQUIRE(b.fen() == "4k3/8/8/8/8/8/8/4K3 b - - 0 1");
  }
}

TEST_CASE("Fen normalisation", "[fen_normalise]")
{
  bitboard::init();

  Board b{};

  SECTION("Castling rights without the rook are dropped")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/8/4K3 w KQkq - 0 1"));
    REQUIRE(b.castle_rights() == BLACK_ANY);
    REQUIRE(b.is_ok());
  }

  SECTION("Fields after the full-move number are ignored")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/4K3 b - - 3 20 extra"));
    REQUIRE(b.rule50() == 3);
    REQUIRE(b.ply() == 39);
    REQUIRE(b.fen() == "4k3/8/8/8/8/8/8/4K3 b - - 3 20");
  }

  SECTION("En passant square without a pushed pawn is dropped")
  {
    REQUIRE(b.set_fen("4k3/8/8/8/8/8/8/4K3 w - e6 0 1"));
    REQUIRE(b.en_passant_square() == NO_SQ);
  }
}

TEST_CASE("Malformed fens are rejected", "[fen_reject]")
{
  bitboard::init();

  constexpr std::array<std::string_view, 15> bad_fens{
    "",
    "8/8/8/8/8/8/8/8",
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNX w KQkq - 0 1",
    "rnbqkbnrr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
    "rnbqkbnr/pppppppp/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkx - 0 1",
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e5 0 1",
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKKNR w kq - 0 1",
    "4k3/8/8/8/8/8/8/8 w - - 0 1",
    "4k3/8/8/8/8/8/8/4RK2 w - - 0 1",
    "4k3/8/8/8/8/8/8/4K3 w - - 99999999999 1",
    "4k3/8/8/8/8/8/8/4K3 w - - 0 4294967297",
    "4k3/8/8/8/8/8/8/4K3 w - - -1 1",
    "4k3/8/8/8/8/8/8/4K3 w - - 0 12x"};

  for (const auto fen : bad_fens)
  {
    Board b{};
    REQUIRE_FALSE(b.set_fen(fen));
    REQUIRE(b.pieces() == ZeroBB);
  }
}

TEST_CASE("Double push sets and the next move clears en passant", "[en_passant_lifecycle]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(start_position));

  const auto e2e4 = init_move(E2, E4, DOUBLE_PUSH);
  const auto undo = b.make_move(e2e4);

  REQUIRE(b.en_passant_square() == E3);
  REQUIRE(b.side_to_move() == BLACK);
  REQUIRE(b.ply() == 1);
  REQUIRE(b.piece(E4) == W_PAWN);
  REQUIRE(b.piece(E2) == NO_PIECE);
  REQUIRE(undo.captured == NO_PT);
  REQUIRE(undo.en_passant_square == NO_SQ);

  const auto g8f6  = init_move(G8, F6);
  const auto undo2 = b.make_move(g8f6);

  REQUIRE(b.en_passant_square() == NO_SQ);
  REQUIRE(b.rule50() == 1);

  b.unmake_move(g8f6, undo2);
  REQUIRE(b.en_passant_square() == E3);

  b.unmake_move(e2e4, undo);
  REQUIRE(b.fen() == start_position);
}

TEST_CASE("En passant capture removes the passed pawn", "[en_passant_capture]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3"));

  const Board before = b;
  const auto m       = init_move(E5, F6, EP_CAPTURE);
  const auto undo    = b.make_move(m);

  REQUIRE(undo.captured == PAWN);
  REQUIRE(b.piece(F6) == W_PAWN);
  REQUIRE(b.piece(F5) == NO_PIECE);
  REQUIRE(b.piece(E5) == NO_PIECE);
  REQUIRE(b.piece(D5) == B_PAWN);
  REQUIRE(b.en_passant_square() == NO_SQ);
  REQUIRE(b.rule50() == 0);

  b.unmake_move(m, undo);

  REQUIRE(b == before);
  REQUIRE(b.piece(F5) == B_PAWN);
}

TEST_CASE("Castling moves king and rook", "[castle]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(castle_position));

  const Board before = b;

  SECTION("White king side")
  {
    const auto m    = init_move(E1, G1, KING_CASTLE);
    const auto undo = b.make_move(m);

    REQUIRE(b.piece(G1) == W_KING);
    REQUIRE(b.piece(F1) == W_ROOK);
    REQUIRE(b.piece(H1) == NO_PIECE);
    REQUIRE(b.piece(E1) == NO_PIECE);
    REQUIRE(b.king_sq(WHITE) == G1);
    REQUIRE(b.castle_rights() == BLACK_ANY);

    b.unmake_move(m, undo);
    REQUIRE(b == before);
  }

  SECTION("White queen side")
  {
    const auto m    = init_move(E1, C1, QUEEN_CASTLE);
    const auto undo = b.make_move(m);

    REQUIRE(b.piece(C1) == W_KING);
    REQUIRE(b.piece(D1) == W_ROOK);
    REQUIRE(b.piece(A1) == NO_PIECE);
    REQUIRE(b.castle_rights() == BLACK_ANY);

    b.unmake_move(m, undo);
    REQUIRE(b == before);
  }

  SECTION("Black both sides")
  {
    const auto quiet = init_move(A1, A2);
    const auto u1    = b.make_move(quiet);

    const auto oo = init_move(E8, G8, KING_CASTLE);
    const auto u2 = b.make_move(oo);

    REQUIRE(b.piece(G8) == B_KING);
    REQUIRE(b.piece(F8) == B_ROOK);
    REQUIRE(b.piece(H8) == NO_PIECE);
    REQUIRE(b.castle_rights() == WHITE_OO);

    b.unmake_move(oo, u2);

    const auto ooo = init_move(E8, C8, QUEEN_CASTLE);
    const auto u3  = b.make_move(ooo);

    REQUIRE(b.piece(C8) == B_KING);
    REQUIRE(b.piece(D8) == B_ROOK);
    REQUIRE(b.piece(A8) == NO_PIECE);

    b.unmake_move(ooo, u3);
    b.unmake_move(quiet, u1);
    REQUIRE(b == before);
  }
}

TEST_CASE("Castling rights are monotonic", "[castle_rights]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(castle_position));

  SECTION("Capturing a corner rook clears both sides' rights")
  {
    const auto m    = init_move(H1, H8, CAPTURE);
    const auto undo = b.make_move(m);

    REQUIRE(undo.captured == ROOK);
    REQUIRE(b.castle_rights() == (WHITE_OOO | BLACK_OOO));

    // the right does not come back by moving the king and rook around
    const auto m2    = init_move(E8, E7);
    const auto undo2 = b.make_move(m2);
    REQUIRE(b.castle_rights() == WHITE_OOO);

    b.unmake_move(m2, undo2);
    REQUIRE(b.castle_rights() == (WHITE_OOO | BLACK_OOO));

    b.unmake_move(m, undo);
    REQUIRE(b.castle_rights() == ANY_CASTLING);
  }

  SECTION("A rook move clears only its own side")
  {
    const auto m = init_move(A1, B1);
    static_cast<void>(b.make_move(m));
    REQUIRE(b.castle_rights() == (WHITE_OO | BLACK_ANY));

    const auto back = init_move(A8, A7);
    static_cast<void>(b.make_move(back));
    REQUIRE(b.castle_rights() == (WHITE_OO | BLACK_OO));
  }

  SECTION("Captures away from the home squares keep the rights")
  {
    REQUIRE(b.set_fen("r3k2r/8/8/8/8/8/p7/R3K2R w KQkq - 0 1"));
    const auto m = init_move(A1, A2, CAPTURE);
    static_cast<void>(b.make_move(m));
    REQUIRE(b.castle_rights() == (WHITE_OO | BLACK_ANY));

    REQUIRE(b.set_fen("r3k2r/8/8/3p4/8/2N5/8/R3K2R w KQkq - 0 1"));
    const auto m2 = init_move(C3, D5, CAPTURE);
    static_cast<void>(b.make_move(m2));
    REQUIRE(b.castle_rights() == ANY_CASTLING);
  }
}

TEST_CASE("Promotion", "[promotion]")
{
  bitboard::init();

  Board b{};

  SECTION("Quiet promotion gives check")
  {
    REQUIRE(b.set_fen("4k3/P7/8/8/8/8/8/4K3 w - - 0 1"));
    const Board before = b;

    const auto m    = init_move(A7, A8, QUEEN_PROMOTION);
    const auto undo = b.make_move(m);

    REQUIRE(b.piece(A8) == W_QUEEN);
    REQUIRE(b.piece(A7) == NO_PIECE);
    REQUIRE(b.in_check());
    REQUIRE(b.checkers() == bit(A8));

    b.unmake_move(m, undo);
    REQUIRE(b == before);
    REQUIRE(b.piece(A7) == W_PAWN);
  }

  SECTION("Capture promotion")
  {
    REQUIRE(b.set_fen("1r2k3/P7/8/8/8/8/8/4K3 w - - 0 1"));
    const Board before = b;

    const auto m    = init_move(A7, B8, KNIGHT_PROMO_CAPTURE);
    const auto undo = b.make_move(m);

    REQUIRE(undo.captured == ROOK);
    REQUIRE(b.piece(B8) == W_KNIGHT);
    REQUIRE(pop_count(b.pieces(ROOK)) == 0);

    b.unmake_move(m, undo);
    REQUIRE(b == before);
    REQUIRE(b.piece(B8) == B_ROOK);
  }
}

TEST_CASE("Every legal move round trips", "[round_trip]")
{
  bitboard::init();

  constexpr std::array<std::string_view, 4> fens{
    start_position,
    kiwipete,
    "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1",
    "rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3"};

  for (const auto fen : fens)
  {
    Board b{};
    REQUIRE(b.set_fen(fen));

    const Board before = b;
    const MoveList<LEGALMOVES> moves(&b);

    REQUIRE_FALSE(moves.empty());

    for (const auto m : moves)
    {
      const auto undo = b.make_move(m);
      REQUIRE(b.is_ok());
      REQUIRE(b.side_to_move() != before.side_to_move());
      b.unmake_move(m, undo);
      REQUIRE(b == before);
    }
  }
}

TEST_CASE("Rule 50 counter", "[rule50]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(start_position));

  const auto m    = init_move(G1, F3);
  const auto undo = b.make_move(m);
  REQUIRE(b.rule50() == 1);
  REQUIRE(undo.rule50 == 0);

  const auto m2    = init_move(E7, E5, DOUBLE_PUSH);
  const auto undo2 = b.make_move(m2);
  REQUIRE(b.rule50() == 0);

  b.unmake_move(m2, undo2);
  REQUIRE(b.rule50() == 1);
  b.unmake_move(m, undo);
  REQUIRE(b.rule50() == 0);
}

TEST_CASE("Move from string", "[move_from_string]")
{
  bitboard::init();

  Board b{};
  REQUIRE(b.set_fen(start_position));

  REQUIRE(b.move_from_string("e2e4") == init_move(E2, E4, DOUBLE_PUSH));
  REQUIRE(b.move_from_string("g1f3") == init_move(G1, F3));
  REQUIRE(b.move_from_string("e2e5") == MOVE_NONE);
  REQUIRE(b.move_from_string("junk") == MOVE_NONE);

  REQUIRE(b.set_fen(castle_position));
  REQUIRE(b.move_from_string("e1g1") == init_move(E1, G1, KING_CASTLE));
  REQUIRE(b.move_from_string("h1h8") == init_move(H1, H8, CAPTURE));
}

TEST_CASE("Board diagram", "[print]")
{
  bitboard::init();

  const Board b(start_position);
  const auto diagram = b.print();

  REQUIRE(diagram.find("r n b q k b n r") != std::string::npos);
  REQUIRE(diagram.find(start_position) != std::string::npos);
}
