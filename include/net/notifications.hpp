#ifndef NOTIFICATIONS_HPP
#define NOTIFICATIONS_HPP

#include <string>

// JSON bodies of server -> client MESSAGE frames.
namespace notifications {

std::string transcription(const std::string& text, float eotProbability, bool isPartial);
std::string response(const std::string& text);
std::string audioEnd();
std::string error(const std::string& message);

} // namespace notifications

#endif
