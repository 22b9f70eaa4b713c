#ifndef TRANSCRIPT_TEXT_HPP
#define TRANSCRIPT_TEXT_HPP

#include <string>

// Strips surrounding whitespace and closed non-speech markers such as "[BLANK_AUDIO]"
// or "(music)". An unclosed bracket is kept as ordinary text.
std::string cleanTranscript(const std::string& raw);

#endif
