// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <string_view>
#include <vector>

#include "errors.hpp"
#include "token.hpp"

namespace arfidl {

struct LexResult {
  std::vector<Token> tokens; // always terminated by an Eof token
  Diagnostics errors;
};

// Converts source text into tokens. Never stops on invalid input: the
// offending characters are skipped and reported as syntax errors.
LexResult tokenize(std::string_view file_path, std::string_view text);

} // namespace arfidl
