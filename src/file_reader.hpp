#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg, max_bytes); returns false with
 *        msg on failure. Files longer than max_bytes are cut at that offset
 *        and msg says so. Only regular files are read; the open never blocks.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg,
                    size_t max_bytes = static_cast<size_t>(-1));
