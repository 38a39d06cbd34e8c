#include "duration_utils.h"

#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>

namespace masqueplus {

bool parse_duration_ms(const std::string& text, int* out_ms, std::string* out_err) {
    if (text.empty()) {
        if (out_err) *out_err = "empty duration";
        return false;
    }

    bool all_digits = true;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            all_digits = false;
            break;
        }
    }

    long long total = 0;
    if (all_digits) {
        if (text.size() > 7) {
            if (out_err) *out_err = "duration out of range: " + text;
            return false;
        }
        total = std::stoll(text) * 1000;
    } else {
        size_t i = 0;
        while (i < text.size()) {
            size_t start = i;
            while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
                ++i;
            }
            if (start == i || i - start > 12) {
                if (out_err) *out_err = "invalid duration: " + text;
                return false;
            }
            double value = 0;
            try {
                value = std::stod(text.substr(start, i - start));
            } catch (const std::exception&) {
                if (out_err) *out_err = "invalid duration: " + text;
                return false;
            }

            start = i;
            while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            const std::string unit = text.substr(start, i - start);
            double factor = 0;
            if (unit == "ms") factor = 1;
            else if (unit == "s") factor = 1000;
            else if (unit == "m") factor = 60 * 1000;
            else if (unit == "h") factor = 60 * 60 * 1000;
            else {
                if (out_err) *out_err = "unknown unit \"" + unit + "\" in duration " + text;
                return false;
            }
            total += static_cast<long long>(value * factor);
            if (total > INT_MAX) {
                if (out_err) *out_err = "duration out of range: " + text;
                return false;
            }
        }
    }

    if (total > INT_MAX) {
        if (out_err) *out_err = "duration out of range: " + text;
        return false;
    }
    if (out_ms) *out_ms = static_cast<int>(total);
    return true;
}

std::string format_duration_ms(long long ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    const long long hours = ms / 3600000;
    const long long minutes = (ms % 3600000) / 60000;
    const long long seconds = (ms % 60000) / 1000;
    const long long millis = ms % 1000;
    if (hours > 0) oss << hours << 'h';
    if (hours > 0 || minutes > 0) oss << minutes << 'm';
    oss << seconds;
    if (millis > 0) {
        std::string frac = std::to_string(millis + 1000).substr(1);
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        oss << '.' << frac;
    }
    oss << 's';
    return oss.str();
}

} // namespace masqueplus
