#pragma once
/*
 * Help
 *
 * Purpose: the static key-binding reference shown by Ctrl+G.
 */
#include <string>
#include <vector>

const std::vector<std::string>& help_lines();
