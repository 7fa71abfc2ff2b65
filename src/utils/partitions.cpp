#include "utils/partitions.hpp"
#include <filesystem>

namespace gridedge {
namespace partitions {

std::string partition_path(
    const std::string& root,
    const std::string& layer,
    const std::string& league,
    int season,
    std::optional<int> week
) {
    std::filesystem::path p = std::filesystem::path(root) / layer
        / ("league=" + league) / ("season=" + std::to_string(season));
    if (week) {
        p /= "week=" + std::to_string(*week);
    }
    return p.string();
}

void ensure_dir(const std::string& path) {
    std::filesystem::create_directories(path);
}

} // namespace partitions
} // namespace gridedge
