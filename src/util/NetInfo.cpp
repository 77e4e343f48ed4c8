#include "util/NetInfo.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <map>

namespace NetInfo {

std::vector<std::string> InterfaceSummary() {
    std::vector<std::string> lines;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        std::cerr << "getifaddrs failed: " << std::strerror(errno) << "\n";
        lines.push_back("No network interfaces");
        return lines;
    }

    // Interfaces are reported once per address family; keep first-seen order.
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> addresses;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_name) {
            continue;
        }
        std::string name = it->ifa_name;
        if (addresses.find(name) == addresses.end()) {
            order.push_back(name);
            addresses[name];
        }
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {};
        const auto* in = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) {
            addresses[name].push_back(buf);
        }
    }
    freeifaddrs(list);

    for (const auto& name : order) {
        const auto& addrs = addresses[name];
        std::string line = name + ":";
        if (addrs.empty()) {
            line += " No IP addr";
        }
        for (const auto& addr : addrs) {
            line += " " + addr;
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace NetInfo
