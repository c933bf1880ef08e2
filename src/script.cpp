#include "script.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <istream>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <ostream>
#include <sstream>

#include "utility.h"

namespace tilegrid {

namespace {

std::optional<int> parse_int(const std::string& token) {
  try {
    size_t consumed = 0;
    int value = std::stoi(token, &consumed);
    if (consumed != token.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<layout::ItemId> parse_item(const std::string& token) {
  if (token.empty() || token[0] == '-' || token[0] == '+') {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    auto value = std::stoull(token, &consumed);
    if (consumed != token.size()) {
      return std::nullopt;
    }
    return static_cast<layout::ItemId>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<layout::Direction> parse_direction(const std::string& token) {
  return magic_enum::enum_cast<layout::Direction>(token, magic_enum::case_insensitive);
}

struct StepParse {
  std::optional<ScriptStep> step;
  std::string error;
};

StepParse fail(std::string error) {
  return StepParse{std::nullopt, std::move(error)};
}

StepParse parse_step(const std::vector<std::string>& tokens) {
  const std::string& cmd = tokens[0];
  const size_t argc = tokens.size() - 1;

  if (cmd == "place") {
    if (argc != 3 && argc != 5) {
      return fail("place expects <item> <row> <col> [<row_span> <col_span>]");
    }
    auto item = parse_item(tokens[1]);
    auto row = parse_int(tokens[2]);
    auto column = parse_int(tokens[3]);
    if (!item || !row || !column) {
      return fail("place: invalid number");
    }
    PlaceStep step{*item, *row, *column, 1, 1};
    if (argc == 5) {
      auto row_span = parse_int(tokens[4]);
      auto column_span = parse_int(tokens[5]);
      if (!row_span || !column_span) {
        return fail("place: invalid span");
      }
      step.row_span = *row_span;
      step.column_span = *column_span;
    }
    return StepParse{step, ""};
  }

  if (cmd == "remove") {
    if (argc != 1) {
      return fail("remove expects <item>");
    }
    auto item = parse_item(tokens[1]);
    if (!item) {
      return fail("remove: invalid item");
    }
    return StepParse{RemoveStep{*item}, ""};
  }

  if (cmd == "move") {
    if (argc != 3) {
      return fail("move expects <item> <row> <col>");
    }
    auto item = parse_item(tokens[1]);
    auto row = parse_int(tokens[2]);
    auto column = parse_int(tokens[3]);
    if (!item || !row || !column) {
      return fail("move: invalid number");
    }
    return StepParse{MoveStep{*item, *row, *column}, ""};
  }

  if (cmd == "resize") {
    if (argc != 3) {
      return fail("resize expects <item> <north|south|east|west> <units>");
    }
    auto item = parse_item(tokens[1]);
    auto direction = parse_direction(tokens[2]);
    auto units = parse_int(tokens[3]);
    if (!item || !units) {
      return fail("resize: invalid number");
    }
    if (!direction) {
      return fail("resize: unknown direction " + tokens[2]);
    }
    return StepParse{ResizeStep{*item, *direction, *units}, ""};
  }

  if (cmd == "print") {
    if (argc != 0) {
      return fail("print takes no arguments");
    }
    return StepParse{PrintStep{}, ""};
  }

  return fail("unknown command: " + cmd);
}

template <typename Result>
bool report(const Result& result, int line_number, std::ostream& out) {
  if (result.success) {
    return true;
  }
  std::string_view kind =
      result.error.has_value() ? magic_enum::enum_name(*result.error) : std::string_view("Error");
  out << "line " << line_number << ": " << kind << ": " << result.error_message << "\n";
  return false;
}

} // namespace

ScriptParseResult parse_script(std::istream& input) {
  ScriptParseResult result{true, "", {}};
  std::string text;
  int line_number = 0;

  while (std::getline(input, text)) {
    ++line_number;
    auto comment = text.find('#');
    if (comment != std::string::npos) {
      text.erase(comment);
    }

    std::istringstream words(text);
    std::vector<std::string> tokens;
    std::string token;
    while (words >> token) {
      tokens.push_back(token);
    }
    if (tokens.empty()) {
      continue;
    }

    auto parsed = parse_step(tokens);
    if (!parsed.step.has_value()) {
      return ScriptParseResult{false, "line " + std::to_string(line_number) + ": " + parsed.error,
                               {}};
    }
    result.lines.push_back({line_number, *parsed.step});
  }

  return result;
}

ScriptParseResult parse_script_file(const std::filesystem::path& filepath) {
  std::ifstream file(filepath);
  if (!file) {
    return ScriptParseResult{false, "Failed to open script: " + filepath.string(), {}};
  }
  return parse_script(file);
}

ScriptRunResult run_script(Engine& engine, const std::vector<ScriptLine>& lines,
                           std::ostream& out) {
  ScriptRunResult run;

  for (const auto& line : lines) {
    bool ok = std::visit(
        overloaded{
            [&](const PlaceStep& s) {
              return report(engine.place(s.item, s.row, s.column, s.row_span, s.column_span),
                            line.line_number, out);
            },
            [&](const RemoveStep& s) {
              return report(engine.remove(s.item), line.line_number, out);
            },
            [&](const MoveStep& s) {
              return report(engine.move(s.item, s.row, s.column), line.line_number, out);
            },
            [&](const ResizeStep& s) {
              auto result = engine.resize(s.item, s.direction, s.units);
              if (result.success) {
                out << "item " << s.item << " " << magic_enum::enum_name(s.direction)
                    << ": granted " << result.granted << " of " << s.units << " -> "
                    << layout::to_string(result.rect) << "\n";
              }
              return report(result, line.line_number, out);
            },
            [&](const PrintStep&) {
              out << layout::format_layout(engine.tile_layout) << "\n";
              layout::debug_print_layout(engine.tile_layout);
              return true;
            },
        },
        line.step);

    ++run.executed;
    if (!ok) {
      ++run.failed;
    }
  }

  if (!engine.validate()) {
    spdlog::error("Layout failed validation after running the script");
  }
  return run;
}

} // namespace tilegrid
