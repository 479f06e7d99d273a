#include <catch2/catch.hpp>
#include "command_translator.hpp"

using namespace rconbridge;

static CommandTranslator default_translator() {
    return CommandTranslator({
        {"cheer", {"give {player} {amount}"}},
        {"chat", {"/puppet [{platform}] {speaker} {message}"}},
        {"redemption", {"/c game.print(\"{user_name} redeemed {reward}\")"}},
    }, "twitch");
}

static InboundEvent cheer(const std::string& user_id, int64_t bits) {
    InboundEvent ev;
    ev.fingerprint = "msg:c1";
    ev.source_platform = "twitch";
    ev.source_user_id = user_id;
    ev.kind = EventKind::Cheer;
    ev.user_name = "viewer";
    ev.amount = bits;
    return ev;
}

static InboundEvent chat(const std::string& name, const std::string& text,
                         const std::string& color = "") {
    InboundEvent ev;
    ev.fingerprint = "msg:t1";
    ev.source_platform = "twitch";
    ev.source_user_id = "U9";
    ev.kind = EventKind::Chat;
    ev.user_name = name;
    ev.message = text;
    ev.color = color;
    return ev;
}

// ── Sanitizers ───────────────────────────────────────────────────

TEST_CASE("sanitize_console_text: strips control characters", "[translator]") {
    REQUIRE(sanitize_console_text("a\r\nb\x7f" "d") == "abd");
    REQUIRE(sanitize_console_text(std::string("x\0y", 3)) == "xy");
    REQUIRE(sanitize_console_text("tab\there") == "tabhere");
}

TEST_CASE("sanitize_console_text: escapes quotes and backslashes", "[translator]") {
    REQUIRE(sanitize_console_text(R"(say "hi" \o/)") == R"(say \"hi\" \\o/)");
}

TEST_CASE("sanitize_console_text: cuts on a UTF-8 boundary", "[translator]") {
    // "é" is two bytes; a 5-byte cap must not split the second one
    std::string s = "ab\xc3\xa9\xc3\xa9";
    REQUIRE(sanitize_console_text(s, 5) == "ab\xc3\xa9");
    REQUIRE(sanitize_console_text(s, 3) == "ab");
}

TEST_CASE("sanitize_console_text: never ends in a lone escape", "[translator]") {
    // The escaped quote is two bytes; a cap between them drops both
    REQUIRE(sanitize_console_text("abc\"", 4) == "abc");
    REQUIRE(sanitize_console_text("abc\\", 5) == "abc\\\\");
}

TEST_CASE("sanitize_identifier: allowed characters only, capped", "[translator]") {
    REQUIRE(sanitize_identifier("Steve; /c game.crash()") == "Stevecgame.crash");
    REQUIRE(sanitize_identifier("user_name-1.2") == "user_name-1.2");
    REQUIRE(sanitize_identifier(std::string(100, 'a')).size() == 64);
}

TEST_CASE("expand_template: known and unknown placeholders", "[translator]") {
    REQUIRE(expand_template("give {player} {amount}", {{"player", "Steve"}, {"amount", "100"}}) ==
            "give Steve 100");
    REQUIRE(expand_template("{nope} {player", {{"player", "x"}}) == "{nope} {player");
}

// ── Inbound events ───────────────────────────────────────────────

TEST_CASE("CommandTranslator: cheer with linked player", "[translator]") {
    auto t = default_translator();

    auto cmds = t.translate(cheer("U1", 100), Identity{"factorio", "Steve"});
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0].text == "give Steve 100");
    REQUIRE(cmds[0].fingerprint == "msg:c1");
}

TEST_CASE("CommandTranslator: player templates are skipped without a player", "[translator]") {
    auto t = default_translator();
    REQUIRE(t.translate(cheer("U1", 100), std::nullopt).empty());
}

TEST_CASE("CommandTranslator: player name is sanitized", "[translator]") {
    auto t = default_translator();
    auto cmds = t.translate(cheer("U1", 5), Identity{"factorio", "Ste ve\"; rm"});
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0].text == "give Steverm 5");
}

TEST_CASE("CommandTranslator: chat becomes a puppet command", "[translator]") {
    auto t = default_translator();

    auto cmds = t.translate(chat("Viewer", "hello \"there\"\n"), std::nullopt);
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0].text == R"(/puppet [twitch] Viewer: hello \"there\")");
}

TEST_CASE("CommandTranslator: chat color wraps the speaker", "[translator]") {
    auto t = default_translator();
    auto cmds = t.translate(chat("Viewer", "hi", "FF7F50"), std::nullopt);
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0].text == "/puppet [twitch] [color=#FF7F50]Viewer:[/color] hi");

    // Anything but six safe characters is ignored
    cmds = t.translate(chat("Viewer", "hi", "red]"), std::nullopt);
    REQUIRE(cmds[0].text == "/puppet [twitch] Viewer: hi");
}

TEST_CASE("CommandTranslator: /players asks the game for the player list", "[translator]") {
    auto t = default_translator();
    for (const char* text : {"/players", "  /players  ", "/players online"}) {
        auto cmds = t.translate(chat("Viewer", text), std::nullopt);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0].text == CommandTranslator::PLAYER_LIST_COMMAND);
    }
    auto cmds = t.translate(chat("Viewer", "/playersX"), std::nullopt);
    REQUIRE(cmds[0].text != CommandTranslator::PLAYER_LIST_COMMAND);
}

TEST_CASE("CommandTranslator: kinds without templates translate to nothing", "[translator]") {
    auto t = default_translator();
    InboundEvent follow;
    follow.kind = EventKind::Follow;
    follow.user_name = "f";
    REQUIRE(t.translate(follow, std::nullopt).empty());

    InboundEvent unknown;
    unknown.kind = EventKind::Unknown;
    REQUIRE(t.translate(unknown, Identity{"factorio", "Steve"}).empty());
}

TEST_CASE("CommandTranslator: several templates keep their order", "[translator]") {
    CommandTranslator t({{"subscribe", {"first {user_name}", "second {tier}", "third {player}"}}},
                        "twitch");
    InboundEvent ev;
    ev.kind = EventKind::Subscribe;
    ev.user_name = "sub";
    ev.tier = "1000";
    auto cmds = t.translate(ev, Identity{"factorio", "Steve"});
    REQUIRE(cmds.size() == 3);
    REQUIRE(cmds[0].text == "first sub");
    REQUIRE(cmds[1].text == "second 1000");
    REQUIRE(cmds[2].text == "third Steve");
}

TEST_CASE("CommandTranslator: reward text is escaped", "[translator]") {
    auto t = default_translator();
    InboundEvent ev;
    ev.kind = EventKind::Redemption;
    ev.user_name = "fan";
    ev.reward = "Drop \"nuke\"";
    auto cmds = t.translate(ev, std::nullopt);
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0].text == R"x(/c game.print("fan redeemed Drop \"nuke\"")x");
}
