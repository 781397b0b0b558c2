#pragma once
/*
 * ColumnMap
 *
 * Purpose: convert between logical (character) and visual (tab-expanded) columns.
 * Note: pure functions; a tab advances to the next multiple of tab_stop.
 */
#include <string>
#include <string_view>

int visual_column(std::string_view line, int char_col, int tab_stop);
int logical_column(std::string_view line, int visual_target, int tab_stop);
int visual_width(std::string_view line, int tab_stop);
std::string expand_tabs(std::string_view line, int tab_stop);
