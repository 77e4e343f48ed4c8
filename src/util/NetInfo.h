#pragma once

#include <string>
#include <vector>

namespace NetInfo {

// One line per interface: "eth0: 192.168.1.20", or "lo: No IP addr" when the
// interface has no IPv4 address bound.
std::vector<std::string> InterfaceSummary();

}
