#include "scan/scan_id.hpp"

#include <chrono>
#include <random>

namespace scanbound::scan {

std::string GenerateScanId(const std::string& prefix) {
    static const char* kChars = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 35);
    std::string suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix.push_back(kChars[dist(gen)]);
    }
    return prefix + "_" + std::to_string(NowMs()) + "_" + suffix;
}

long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace scanbound::scan
