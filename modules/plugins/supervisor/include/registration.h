#ifndef MASQUEPLUS_REGISTRATION_H
#define MASQUEPLUS_REGISTRATION_H

#include <string>

namespace masqueplus {

struct RegistrationOptions {
    std::string binary;
    std::string device_name = "masque-plus";
    int timeout_ms = 120000;
};

// Runs `<binary> register -n <device_name>`, answers both confirmation
// prompts and relays the tool's output to the log. Succeeds on exit status 0.
bool run_registration(const RegistrationOptions& options, std::string* out_err);

} // namespace masqueplus

#endif // MASQUEPLUS_REGISTRATION_H
