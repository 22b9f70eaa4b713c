#include "stt/transcript_text.hpp"

#include <cctype>

std::string cleanTranscript(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (c == '[' || c == '(') {
            const size_t close = raw.find(c == '[' ? ']' : ')', i + 1);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(c);
        ++i;
    }

    size_t b = 0, e = out.size();
    while (b < e && std::isspace((unsigned char)out[b])) ++b;
    while (e > b && std::isspace((unsigned char)out[e - 1])) --e;
    return out.substr(b, e - b);
}
