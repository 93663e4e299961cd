#pragma once
#ifndef GUTEX_WORD_SCANNER_H
#define GUTEX_WORD_SCANNER_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gutex {

/** ASCII whitespace: space, \t, \n, \v, \f, \r. */
bool isAsciiSpace(unsigned char c);

/** True for UTF-8 continuation bytes (10xxxxxx). */
bool isUtf8Continuation(unsigned char c);

/** Sequence length announced by a UTF-8 lead byte; 1 for invalid leads. */
std::size_t utf8SequenceLength(unsigned char lead);

/**
 * @brief Trim a byte window to whole code points.
 *
 * Drops leading continuation bytes and a trailing sequence that the
 * window cuts short.
 * @return [first, last) offsets into @p bytes.
 */
std::pair<std::size_t, std::size_t> utf8SafeSpan(const std::string &bytes);

/** A word located in absolute resource offsets. */
struct WordSpan {
  std::int64_t start{0};
  std::int64_t end{0}; ///< Inclusive
  /// False when the word runs into the end of the window that was scanned.
  bool complete{true};
  /// The whitespace before this word contains a blank line.
  bool paragraphBefore{false};
};

/**
 * @brief Find words starting at or after @p from in a fetched window.
 *
 * A word starts at a non-space byte whose predecessor is whitespace, or at
 * @p documentStart itself. Scanning stops after @p maxWords words.
 *
 * @param buffer Bytes of the window.
 * @param bufferStart Absolute offset of buffer[0]. Must be < @p from unless
 *        @p from equals @p documentStart.
 * @param windowIsDocumentEnd When true a word touching the end of the
 *        buffer is complete.
 */
std::vector<WordSpan> scanWords(const std::string &buffer,
                                std::int64_t bufferStart, std::int64_t from,
                                std::int64_t documentStart,
                                bool windowIsDocumentEnd, std::size_t maxWords);

/** Number of whitespace separated words in @p text. */
std::size_t countWords(const std::string &text);

} // namespace gutex

#endif // GUTEX_WORD_SCANNER_H
