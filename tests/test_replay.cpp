#include <doctest/doctest.h>

#include "errors.hpp"
#include "game.hpp"
#include "replay.hpp"
#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

TEST_CASE("Replay options are parsed from --key=value arguments") {
    ReplayOptions opts = parseReplayOptions(
        {"--seed=42", "--board=start.txt", "--moves=moves.txt", "--out=log.jsonl", "--moore", "--show-board"});
    CHECK(opts.has_seed);
    CHECK(opts.seed == 42u);
    CHECK(opts.board_path == "start.txt");
    CHECK(opts.moves_path == "moves.txt");
    CHECK(opts.out_path == "log.jsonl");
    CHECK(opts.moore);
    CHECK(opts.show_board);
    CHECK_FALSE(opts.debug);
    CHECK_FALSE(opts.show_help);

    ReplayOptions defaults = parseReplayOptions({});
    CHECK_FALSE(defaults.has_seed);
    CHECK(defaults.moves_path.empty());

    CHECK(parseReplayOptions({"--help"}).show_help);
}

TEST_CASE("Bad replay options are rejected as InvalidArgument") {
    std::vector<std::vector<std::string>> bad = {{"--seed=4x"}, {"--seed="}, {"--seed=-3"}, {"--frobnicate"}};
    for (const std::vector<std::string>& args : bad) {
        CAPTURE(args[0]);
        try {
            parseReplayOptions(args);
            FAIL("options should have been rejected");
        } catch (const GameError& e) {
            CHECK(e.code() == ErrorCode::InvalidArgument);
        }
    }
}

TEST_CASE("Boards and cleared tiles serialize as JSON arrays") {
    CHECK(serializeFlat({5, NO_DIGIT, 3}) == "[5,-1,3]");
    CHECK(serializeFlat({}) == "[]");
    CHECK(serializeCoords({Coord{4, 4}, Coord{4, 5}}) == "[[4,4],[4,5]]");
    CHECK(serializeCoords({}) == "[]");
    CHECK(std::string(terminalName(TerminalKind::Stuck)) == "stuck");
}

TEST_CASE("A replay logs accepted moves and skips bad ones") {
    Game game(17u);
    Digit head = game.get_nexts()[0];
    game.load_grid(gridWith({{4, 4, head}}));

    std::istringstream moves("4 4\n\n7\n4 5\n0 0\n");
    std::ostringstream json;
    std::ostringstream warnings;
    ReplayStats stats = replayMoves(game, moves, json, warnings, nullptr);

    // "0 0" is never read: the game is already won.
    CHECK(stats.moves_read == 3);
    CHECK(stats.moves_rejected == 2);
    CHECK(warnings.str().find("TileOccupied") != std::string::npos);
    CHECK(warnings.str().find("needs a row and a column") != std::string::npos);

    std::string log = json.str();
    REQUIRE(!log.empty());
    CHECK(log.find('\n') == log.size() - 1);
    CHECK(log.find("\"step\":1,") != std::string::npos);
    CHECK(log.find("\"row\":4,\"col\":5,\"digit\":" + std::to_string(head)) != std::string::npos);
    CHECK(log.find("\"matched\":true") != std::string::npos);
    CHECK(log.find("\"cleared\":[[4,4],[4,5]]") != std::string::npos);
    CHECK(log.find("\"terminal\":\"won\"") != std::string::npos);
    CHECK(game.is_game_over());
}
