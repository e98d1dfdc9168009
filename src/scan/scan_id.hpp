#pragma once

#include <string>

namespace scanbound::scan {

// "<prefix>_<epoch ms>_<9 base36 chars>", e.g. scan_1718000000000_k3j9x0a2b
std::string GenerateScanId(const std::string& prefix);

long long NowMs();

}  // namespace scanbound::scan
