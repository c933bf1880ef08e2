#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <sstream>
#include <string>
#include <variant>

#include "argument_parser.h"
#include "script.h"

using namespace tilegrid;
using namespace tilegrid::layout;

namespace {

ScriptParseResult parse_text(const std::string& text) {
  std::istringstream input(text);
  return parse_script(input);
}

bool contains_text(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Script Parsing
// ============================================================================

TEST_SUITE("parse_script") {
  TEST_CASE("parses every step kind") {
    auto result = parse_text("place 1 0 0\n"
                             "place 2 4 1 2 2\n"
                             "remove 1\n"
                             "move 2 3 1\n"
                             "resize 2 West 3\n"
                             "print\n");

    REQUIRE(result.success);
    REQUIRE(result.lines.size() == 6);

    auto* place = std::get_if<PlaceStep>(&result.lines[1].step);
    REQUIRE(place != nullptr);
    CHECK(place->item == 2);
    CHECK(place->row == 4);
    CHECK(place->column == 1);
    CHECK(place->row_span == 2);
    CHECK(place->column_span == 2);

    auto* single = std::get_if<PlaceStep>(&result.lines[0].step);
    REQUIRE(single != nullptr);
    CHECK(single->row_span == 1);
    CHECK(single->column_span == 1);

    CHECK(std::holds_alternative<RemoveStep>(result.lines[2].step));
    CHECK(std::holds_alternative<MoveStep>(result.lines[3].step));

    auto* resize = std::get_if<ResizeStep>(&result.lines[4].step);
    REQUIRE(resize != nullptr);
    CHECK(resize->direction == Direction::West);
    CHECK(resize->units == 3);

    CHECK(std::holds_alternative<PrintStep>(result.lines[5].step));
  }

  TEST_CASE("comments and blank lines are skipped but counted") {
    auto result = parse_text("# header\n"
                             "\n"
                             "   place 1 0 0   # trailing comment\n");

    REQUIRE(result.success);
    REQUIRE(result.lines.size() == 1);
    CHECK(result.lines[0].line_number == 3);
  }

  TEST_CASE("directions are case insensitive and units may be negative") {
    auto result = parse_text("resize 4 north -2\n");

    REQUIRE(result.success);
    auto* resize = std::get_if<ResizeStep>(&result.lines[0].step);
    REQUIRE(resize != nullptr);
    CHECK(resize->direction == Direction::North);
    CHECK(resize->units == -2);
  }

  TEST_CASE("errors name the offending line") {
    auto unknown = parse_text("place 1 0 0\nexplode 3\n");
    CHECK_FALSE(unknown.success);
    CHECK(contains_text(unknown.error, "line 2"));
    CHECK(contains_text(unknown.error, "unknown command"));
    CHECK(unknown.lines.empty());

    auto direction = parse_text("resize 1 up 2\n");
    CHECK_FALSE(direction.success);
    CHECK(contains_text(direction.error, "unknown direction up"));
  }

  TEST_CASE("malformed numbers and argument counts are rejected") {
    CHECK_FALSE(parse_text("place 1 0\n").success);
    CHECK_FALSE(parse_text("place 1 0 0 2\n").success);
    CHECK_FALSE(parse_text("place x 0 0\n").success);
    CHECK_FALSE(parse_text("place -1 0 0\n").success);
    CHECK_FALSE(parse_text("place 1 0 0x\n").success);
    CHECK_FALSE(parse_text("remove\n").success);
    CHECK_FALSE(parse_text("move 1 2\n").success);
    CHECK_FALSE(parse_text("print now\n").success);
  }

  TEST_CASE("missing script file") {
    auto result = parse_script_file("/nonexistent/tilegrid/script.txt");

    CHECK_FALSE(result.success);
    CHECK(contains_text(result.error, "Failed to open script"));
  }
}

// ============================================================================
// Script Execution
// ============================================================================

TEST_SUITE("run_script") {
  TEST_CASE("steps run in order and failures do not stop the script") {
    Engine engine;
    auto parsed = parse_text("place 1 0 0\n"
                             "place 2 0 0\n"
                             "place 2 4 1 2 2\n"
                             "remove 9\n");
    REQUIRE(parsed.success);
    std::ostringstream out;

    auto run = run_script(engine, parsed.lines, out);

    CHECK(run.executed == 4);
    CHECK(run.failed == 2);
    CHECK(contains_text(out.str(), "line 2: AreaOccupied"));
    CHECK(contains_text(out.str(), "line 4: UnknownItem"));
    CHECK(engine.item_rect(2) == TileRect{4, 1, 2, 2});
  }

  TEST_CASE("resize reports the granted units") {
    Engine engine;
    auto parsed = parse_text("place 1 0 0 1 2\nresize 1 east 5\n");
    REQUIRE(parsed.success);
    std::ostringstream out;

    auto run = run_script(engine, parsed.lines, out);

    CHECK(run.failed == 0);
    CHECK(contains_text(out.str(), "item 1 East: granted 2 of 5 -> (0, 0) 1x4"));
  }

  TEST_CASE("print renders the layout") {
    GlobalOptions options = get_default_global_options();
    options.gridOptions.rows = 2;
    options.gridOptions.columns = 2;
    Engine engine(options);
    auto parsed = parse_text("place 3 0 1 2 1\nprint\n");
    REQUIRE(parsed.success);
    std::ostringstream out;

    run_script(engine, parsed.lines, out);

    CHECK(out.str() == ". 3\n. 3\n\n");
  }

  TEST_CASE("disabled operations are reported") {
    Engine engine;
    engine.accept_drag_and_drop(false);
    auto parsed = parse_text("place 1 0 0\nmove 1 1 1\n");
    REQUIRE(parsed.success);
    std::ostringstream out;

    auto run = run_script(engine, parsed.lines, out);

    CHECK(run.failed == 1);
    CHECK(contains_text(out.str(), "line 2: OperationDisabled"));
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

TEST_SUITE("parse_args") {
  TEST_CASE("no arguments means no command") {
    const char* argv[] = {"tilegrid"};

    auto result = parse_args(1, argv);

    REQUIRE(result.success);
    CHECK_FALSE(result.args.command.has_value());
    CHECK_FALSE(result.args.options.log_level.has_value());
  }

  TEST_CASE("help and version flags") {
    const char* help[] = {"tilegrid", "-h"};
    const char* version[] = {"tilegrid", "--version"};

    auto help_result = parse_args(2, help);
    auto version_result = parse_args(2, version);

    REQUIRE(help_result.args.command.has_value());
    CHECK(std::holds_alternative<HelpCommand>(*help_result.args.command));
    REQUIRE(version_result.args.command.has_value());
    CHECK(std::holds_alternative<VersionCommand>(*version_result.args.command));
  }

  TEST_CASE("options before the command") {
    const char* argv[] = {"tilegrid", "--logmode", "debug", "--config", "my.toml", "run",
                          "layout.txt"};

    auto result = parse_args(7, argv);

    REQUIRE(result.success);
    CHECK(result.args.options.log_level == LogLevel::Debug);
    CHECK(result.args.options.config_path == std::string("my.toml"));
    REQUIRE(result.args.command.has_value());
    auto* run = std::get_if<RunCommand>(&*result.args.command);
    REQUIRE(run != nullptr);
    CHECK(run->script_path == "layout.txt");
  }

  TEST_CASE("init-config with and without a path") {
    const char* with_path[] = {"tilegrid", "init-config", "out.toml"};
    const char* without_path[] = {"tilegrid", "init-config"};

    auto a = parse_args(3, with_path);
    auto b = parse_args(2, without_path);

    REQUIRE(a.success);
    auto* cmd_a = std::get_if<InitConfigCommand>(&*a.args.command);
    REQUIRE(cmd_a != nullptr);
    CHECK(cmd_a->filepath == std::string("out.toml"));

    REQUIRE(b.success);
    auto* cmd_b = std::get_if<InitConfigCommand>(&*b.args.command);
    REQUIRE(cmd_b != nullptr);
    CHECK_FALSE(cmd_b->filepath.has_value());
  }

  TEST_CASE("invalid arguments are rejected") {
    const char* bad_level[] = {"tilegrid", "--logmode", "loud"};
    const char* missing_value[] = {"tilegrid", "--config"};
    const char* unknown_option[] = {"tilegrid", "--fast"};
    const char* unknown_command[] = {"tilegrid", "explode"};
    const char* missing_script[] = {"tilegrid", "run"};
    const char* trailing[] = {"tilegrid", "demo", "extra"};

    CHECK_FALSE(parse_args(3, bad_level).success);
    CHECK_FALSE(parse_args(2, missing_value).success);
    CHECK_FALSE(parse_args(2, unknown_option).success);
    CHECK_FALSE(parse_args(2, unknown_command).success);
    CHECK_FALSE(parse_args(2, missing_script).success);

    auto result = parse_args(3, trailing);
    CHECK_FALSE(result.success);
    CHECK(contains_text(result.error, "Unexpected argument: extra"));
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
