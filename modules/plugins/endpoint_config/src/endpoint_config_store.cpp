#include "endpoint_config_store.h"
#include "constants.h"
#include "logger.h"
#include "socket_utils.h"

#include <sys/stat.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <utility>

namespace masqueplus {

using json = nlohmann::json;

namespace {

bool valid_port(const std::string& port) {
    if (port.empty() || port.size() > 5) return false;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    const int value = std::stoi(port);
    return value >= 1 && value <= 65535;
}

bool write_json_file(const std::string& path, const json& doc, std::string* out_err) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        if (out_err) *out_err = "failed to open " + path + " for writing";
        return false;
    }
    out << doc.dump(2) << '\n';
    out.close();
    if (!out) {
        if (out_err) *out_err = "failed to write " + path;
        return false;
    }
    (void)::chmod(path.c_str(), 0644);
    return true;
}

bool read_json_file(const std::string& path, json* out, std::string* out_err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (out_err) *out_err = "failed to open " + path;
        return false;
    }
    try {
        in >> *out;
    } catch (const std::exception& e) {
        if (out_err) *out_err = "failed to parse " + path + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace

bool parse_endpoint(const std::string& endpoint, ParsedEndpoint* out, std::string* out_err) {
    std::string host;
    std::string port;
    bool port_given = false;

    if (is_ip_literal(endpoint)) {
        host = endpoint;
        port = std::to_string(DEFAULT_ENDPOINT_PORT);
    } else if (!endpoint.empty() && endpoint.front() == '[' && endpoint.back() == ']') {
        host = endpoint.substr(1, endpoint.size() - 2);
        port = std::to_string(DEFAULT_ENDPOINT_PORT);
    } else if (split_host_port(endpoint, &host, &port, out_err)) {
        port_given = true;
    } else {
        return false;
    }

    if (!is_ip_literal(host)) {
        if (out_err) *out_err = "invalid IP in endpoint: " + endpoint;
        return false;
    }
    if (!valid_port(port)) {
        if (out_err) *out_err = "invalid port in endpoint: " + endpoint;
        return false;
    }

    if (out) {
        out->ip = host;
        out->port = port;
        out->is_ipv6 = is_ipv6_literal(host);
        out->port_given = port_given;
    }
    return true;
}

bool parse_bind_address(const std::string& bind, std::string* ip, std::string* port, std::string* out_err) {
    std::string host;
    std::string p;
    std::string err;
    if (!split_host_port(bind, &host, &p, &err)) {
        if (out_err) *out_err = "invalid bind address " + bind + ": " + err;
        return false;
    }
    if (!is_ip_literal(host)) {
        if (out_err) *out_err = "invalid bind IP: " + host;
        return false;
    }
    if (!valid_port(p)) {
        if (out_err) *out_err = "invalid bind port: " + p;
        return false;
    }
    if (ip) *ip = host;
    if (port) *port = p;
    return true;
}

EndpointConfigStore::EndpointConfigStore(std::string path) : m_path(std::move(path)) {}

bool EndpointConfigStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(m_path, ec);
}

bool EndpointConfigStore::load(std::string* out_err) {
    if (!exists()) {
        m_doc = json::object();
        return true;
    }
    json doc;
    if (!read_json_file(m_path, &doc, out_err)) {
        return false;
    }
    if (!doc.is_object()) {
        if (out_err) *out_err = m_path + " does not contain a JSON object";
        return false;
    }
    m_doc = std::move(doc);
    return true;
}

bool EndpointConfigStore::set_endpoint(const std::string& endpoint, std::string* out_err) {
    ParsedEndpoint parsed;
    if (!parse_endpoint(endpoint, &parsed, out_err)) {
        return false;
    }
    const char* ip_key = parsed.is_ipv6 ? "endpoint_v6" : "endpoint_v4";
    const char* port_key = parsed.is_ipv6 ? "endpoint_v6_port" : "endpoint_v4_port";
    m_doc[ip_key] = parsed.ip;
    if (parsed.port_given) {
        m_doc[port_key] = parsed.port;
    }
    return true;
}

bool EndpointConfigStore::save(std::string* out_err) const {
    if (!write_json_file(m_path, m_doc, out_err)) {
        return false;
    }
    LOG_DEBUG("config updated", {{"path", m_path}});
    return true;
}

bool save_run_state(const std::string& path, const RunState& state, std::string* out_err) {
    json doc = json::object();
    doc["endpoint"] = state.endpoint;
    doc["socks"] = state.socks;
    return write_json_file(path, doc, out_err);
}

bool load_run_state(const std::string& path, RunState* out, std::string* out_err) {
    json doc;
    if (!read_json_file(path, &doc, out_err)) {
        return false;
    }
    if (!doc.is_object()) {
        if (out_err) *out_err = path + " does not contain a JSON object";
        return false;
    }
    try {
        if (out) {
            out->endpoint = doc.value("endpoint", "");
            out->socks = doc.value("socks", "");
        }
    } catch (const std::exception& e) {
        if (out_err) *out_err = "malformed run state in " + path + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace masqueplus
