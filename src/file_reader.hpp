#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split into lines; normalize CRLF.
 * Usage: read_lines(path, out_lines, msg); returns false with msg on failure.
 * Note: a final '\n' terminates the last line, it does not open a new one.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

void split_lines(std::string_view data, std::vector<std::string>& out_lines);
