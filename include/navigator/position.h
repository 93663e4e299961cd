#pragma once
#ifndef GUTEX_POSITION_H
#define GUTEX_POSITION_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gutex {

/**
 * @brief Navigable window of a resource, computed by the content cleaner.
 *
 * Both ends are inclusive byte offsets into the raw resource.
 */
struct Boundaries {
  std::int64_t startByte{0};
  std::int64_t endByte{0};
  std::int64_t cleanLength{0};
};

/**
 * @brief One materialized chunk of words. Never modified after creation.
 */
struct Position {
  std::int64_t wordIndex{0};
  std::vector<std::string> words;
  /// Words joined by spaces, with "\n\n" where the source has a blank line.
  std::string formattedText;
  std::size_t actualCount{0};
  /// First byte of the first word.
  std::int64_t byteStart{0};
  /// Last byte consumed: the byte before the next chunk, or the last byte
  /// of the last word at the document end.
  std::int64_t byteEnd{0};
  /// Always byteEnd + 1 when set; unset at the document end.
  std::optional<std::int64_t> nextByteStart;
  std::optional<std::int64_t> previousByteEnd;
  double percent{0.0};
  bool isNearEnd{false};
};

} // namespace gutex

#endif // GUTEX_POSITION_H
