#pragma once
/*
 * Renderer
 *
 * Purpose: project selection + palette + terminal size into one full frame.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from App to render, never mutates them.
 */
#include <string>
#include "config.hpp"
#include "iterminal.hpp"
#include "selection.hpp"
#include "types.hpp"
#include "widgets.hpp"

enum class FrameKind { TooSmall, Board };

constexpr int kBoardWidth = 30;
constexpr int kTitleHeight = 1;
constexpr int kRowHeight = 3;

TableView build_table_view(const Grid& grid, const Selection& sel, const TableColors& colors);
std::string too_small_message(const AppConfig& cfg);

class Renderer {
public:
  FrameKind render(ITerminal& term, const Grid& grid, const Selection& sel, const AppConfig& cfg);
};
