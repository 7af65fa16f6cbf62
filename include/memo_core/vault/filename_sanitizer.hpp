#pragma once

#include <cstddef>
#include <string>

namespace memo_core {

constexpr std::size_t MAX_FILENAME_CHARS = 100;
constexpr const char* FILENAME_PLACEHOLDER = "untitled";
constexpr const char* INVALID_FILENAME_CHARS = "<>:\"/\\|?*";

/**
 * @brief Makes service-provided text usable as part of a filename.
 *
 * Removes <>:"/\|?*, trims surrounding whitespace, falls back to "untitled" when nothing is
 * left, then keeps at most MAX_FILENAME_CHARS code points. Input that is not valid UTF-8 is
 * repaired first so truncation never splits a sequence.
 */
std::string sanitize_filename(const std::string& text);

}  // namespace memo_core
