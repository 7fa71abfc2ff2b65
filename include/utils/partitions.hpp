#pragma once

#include <string>
#include <optional>

namespace gridedge {
namespace partitions {

/**
 * Data lake partition directory:
 *   <root>/<layer>/league=<L>/season=<S>[/week=<W>]
 */
std::string partition_path(
    const std::string& root,
    const std::string& layer,
    const std::string& league,
    int season,
    std::optional<int> week = std::nullopt
);

// Create directory and parents if missing
void ensure_dir(const std::string& path);

} // namespace partitions
} // namespace gridedge
