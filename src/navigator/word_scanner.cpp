#include "navigator/word_scanner.h"

#include <algorithm>

namespace gutex {

bool isAsciiSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

bool isUtf8Continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::size_t utf8SequenceLength(unsigned char lead) {
  if ((lead & 0x80) == 0)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 1;
}

std::pair<std::size_t, std::size_t> utf8SafeSpan(const std::string &bytes) {
  std::size_t first = 0;
  while (first < bytes.size() &&
         isUtf8Continuation(static_cast<unsigned char>(bytes[first])))
    ++first;

  std::size_t last = bytes.size();
  // Walk back to the lead byte of the final sequence (at most 3 steps).
  std::size_t lead = last;
  while (lead > first && last - lead < 4) {
    --lead;
    if (!isUtf8Continuation(static_cast<unsigned char>(bytes[lead])))
      break;
  }
  if (lead < last &&
      !isUtf8Continuation(static_cast<unsigned char>(bytes[lead])) &&
      lead + utf8SequenceLength(static_cast<unsigned char>(bytes[lead])) > last)
    last = lead;
  return {first, last};
}

std::vector<WordSpan> scanWords(const std::string &buffer,
                                std::int64_t bufferStart, std::int64_t from,
                                std::int64_t documentStart,
                                bool windowIsDocumentEnd, std::size_t maxWords) {
  std::vector<WordSpan> words;
  const auto size = static_cast<std::int64_t>(buffer.size());
  auto at = [&](std::int64_t abs) {
    return static_cast<unsigned char>(buffer[static_cast<std::size_t>(abs - bufferStart)]);
  };

  std::int64_t pos = std::max(from, bufferStart);
  const std::int64_t limit = bufferStart + size;
  int newlines = 0;
  bool sawGap = false;

  while (pos < limit && words.size() < maxWords) {
    const unsigned char c = at(pos);
    if (isAsciiSpace(c)) {
      if (c == '\n')
        ++newlines;
      sawGap = true;
      ++pos;
      continue;
    }

    const bool startsWord =
        pos == documentStart || (pos > bufferStart && isAsciiSpace(at(pos - 1)));
    if (!startsWord) {
      // Tail of a word that began before the scan; skip it.
      while (pos < limit && !isAsciiSpace(at(pos)))
        ++pos;
      newlines = 0;
      sawGap = false;
      continue;
    }

    WordSpan word;
    word.start = pos;
    word.paragraphBefore = sawGap && newlines >= 2;
    while (pos < limit && !isAsciiSpace(at(pos)))
      ++pos;
    word.end = pos - 1;
    word.complete = pos < limit || windowIsDocumentEnd;
    words.push_back(word);
    newlines = 0;
    sawGap = false;
  }
  return words;
}

std::size_t countWords(const std::string &text) {
  std::size_t count = 0;
  bool inWord = false;
  for (char ch : text) {
    bool space = isAsciiSpace(static_cast<unsigned char>(ch));
    if (!space && !inWord)
      ++count;
    inWord = !space;
  }
  return count;
}

} // namespace gutex
