#ifndef MASQUEPLUS_ENDPOINT_CONFIG_STORE_H
#define MASQUEPLUS_ENDPOINT_CONFIG_STORE_H

#include <nlohmann/json.hpp>

#include <string>

namespace masqueplus {

struct ParsedEndpoint {
    std::string ip;
    std::string port;
    bool is_ipv6 = false;
    bool port_given = false;
};

// Accepts "ip", "ip:port" and "[ipv6]:port". Hostnames are rejected; the
// default port is 443.
bool parse_endpoint(const std::string& endpoint, ParsedEndpoint* out, std::string* out_err);

// Splits "ip:port" for the local bind address.
bool parse_bind_address(const std::string& bind, std::string* ip, std::string* port, std::string* out_err);

// The wrapped binary's JSON config. Only the endpoint keys are touched;
// everything else round-trips unchanged.
class EndpointConfigStore {
public:
    explicit EndpointConfigStore(std::string path);

    bool exists() const;

    // Missing file loads as an empty object. Malformed JSON is an error.
    bool load(std::string* out_err);

    // Sets endpoint_v4/endpoint_v4_port or endpoint_v6/endpoint_v6_port. A bare
    // IP leaves an existing port key as it is.
    bool set_endpoint(const std::string& endpoint, std::string* out_err);

    // Pretty-printed with two-space indent.
    bool save(std::string* out_err) const;

    const nlohmann::json& document() const { return m_doc; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    nlohmann::json m_doc = nlohmann::json::object();
};

struct RunState {
    std::string endpoint;
    std::string socks;
};

bool save_run_state(const std::string& path, const RunState& state, std::string* out_err);
bool load_run_state(const std::string& path, RunState* out, std::string* out_err);

} // namespace masqueplus

#endif // MASQUEPLUS_ENDPOINT_CONFIG_STORE_H
