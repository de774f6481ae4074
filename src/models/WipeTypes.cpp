#include "models/WipeTypes.hpp"

#include <iomanip>
#include <sstream>

auto PassPattern::to_string() const -> std::string {
    if (kind == PatternKind::RANDOM) {
        return "random";
    }

    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    bool first = true;
    for (auto byte : fill_bytes()) {
        if (!first) {
            oss << ' ';
        }
        oss << "0x" << std::setw(2) << static_cast<int>(byte);
        first = false;
    }
    return oss.str();
}

auto PassSpec::label() const -> std::string {
    return "Pass " + std::to_string(index) + "/" + std::to_string(total_passes) + ": " +
           pattern.to_string();
}
