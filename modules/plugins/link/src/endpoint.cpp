#include "endpoint.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace p2plink {

Endpoint::Endpoint(std::string name,
                   std::string interface_name,
                   std::string hw_address,
                   std::string ip_address,
                   std::string netns)
    : m_name(std::move(name)),
      m_interface_name(std::move(interface_name)),
      m_hw_address(normalize_mac(hw_address)),
      m_ip_address(std::move(ip_address)),
      m_netns(std::move(netns)) {
    if (m_interface_name.empty()) {
        throw std::invalid_argument("endpoint '" + m_name + "' has no interface");
    }
    if (m_hw_address.empty()) {
        throw std::invalid_argument("endpoint '" + m_name + "' has an invalid hardware address: " + hw_address);
    }
    // Accept "10.0.0.1/8" as written in topology files
    const auto slash = m_ip_address.find('/');
    if (slash != std::string::npos) {
        m_ip_address.erase(slash);
    }
    if (m_name.empty()) {
        m_name = m_interface_name;
    }
}

std::string Endpoint::label() const {
    return m_name + "(" + m_interface_name + ")";
}

Endpoint Endpoint::parse(const std::string& spec) {
    std::vector<std::string> fields;
    std::stringstream ss(spec);
    std::string field;
    while (std::getline(ss, field, ':')) {
        fields.push_back(field);
    }
    if (!spec.empty() && spec.back() == ':') {
        fields.push_back("");
    }
    if (fields.size() != 9 && fields.size() != 10) {
        throw std::invalid_argument("expected name:iface:mac:ip[:netns], got '" + spec + "'");
    }

    std::string mac;
    for (size_t i = 2; i < 8; ++i) {
        if (i > 2) mac += ':';
        mac += fields[i];
    }
    std::string netns = fields.size() == 10 ? fields[9] : "";
    return Endpoint(fields[0], fields[1], mac, fields[8], netns);
}

std::string normalize_mac(const std::string& mac) {
    if (mac.size() != 17) {
        return "";
    }
    std::string out;
    out.reserve(17);
    for (size_t i = 0; i < mac.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(mac[i]);
        if (i % 3 == 2) {
            if (c != ':') return "";
            out += ':';
        } else {
            if (!std::isxdigit(c)) return "";
            out += static_cast<char>(std::tolower(c));
        }
    }
    return out;
}

} // namespace p2plink
