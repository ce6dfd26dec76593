#pragma once
/*
 * TextUtil
 *
 * Purpose: byte/column helpers shared by the content pane and the renderer.
 * Note: one code point is one display column; input is made valid UTF-8 by
 *       sanitize_line before it reaches the column helpers.
 */
#include <string>
#include <vector>

std::string to_lower(std::string s);

// length of the valid UTF-8 sequence starting at s[i], 0 if invalid
int utf8_seq_len(const std::string& s, size_t i);

// expand tabs, replace control bytes and invalid UTF-8 with '?'
std::string sanitize_line(const std::string& s, int tab_width);

int display_width(const std::string& s);
std::string clip_columns(const std::string& s, int start, int count);
std::vector<std::string> wrap_line(const std::string& s, int width);
