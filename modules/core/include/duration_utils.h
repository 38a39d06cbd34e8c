#ifndef MASQUEPLUS_DURATION_UTILS_H
#define MASQUEPLUS_DURATION_UTILS_H

#include <string>

namespace masqueplus {

// Accepts "250ms", "15s", "2m", "1h", compound forms like "1m30s", and a bare
// integer meaning seconds.
bool parse_duration_ms(const std::string& text, int* out_ms, std::string* out_err);

// 900000 -> "15m0s", 200 -> "200ms", 1500 -> "1.5s"
std::string format_duration_ms(long long ms);

} // namespace masqueplus

#endif // MASQUEPLUS_DURATION_UTILS_H
