#pragma once
/*
 * Renderer
 *
 * Purpose: keep the terminal in sync with the session, redrawing as little
 *          as the dirty region and viewport movement allow.
 * Policy: full repaint on resize/pan/line-count change; otherwise native
 *         scroll plus the exposed rows, then the recorded dirty rows.
 * Dependency: draws via ITerminal to allow backend replacement.
 */
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"
#include "row_image.hpp"
#include "session.hpp"

enum class RenderKind { Full, Scrolled, Partial, StatusOnly };

RowImage compose_row(std::string_view line, int min_col, int width, int tab_stop,
                     int sel_begin_vcol, int sel_end_vcol);

class Renderer {
public:
  RenderKind render(ITerminal& term, EditorSession& s, const std::string& prompt = std::string());
  // full-screen static text; the session is redrawn in full afterwards
  void render_overlay(ITerminal& term, EditorSession& s, const std::vector<std::string>& lines,
                      const std::string& footer);

private:
  void draw_text_row(ITerminal& term, const EditorSession& s, int screen_row);
  void draw_status(ITerminal& term, const EditorSession& s, int row, int cols, const std::string& prompt);
};
