#include "codemap/layout/Partitioner.h"
#include "codemap/common/Logger.h"

#include <unordered_map>

namespace codemap {

std::vector<Container> Partitioner::partition(const std::vector<GraphNode>& nodes) {
    std::vector<Container> containers;
    std::unordered_map<std::string, size_t> containerByFile;

    for (const auto& node : nodes) {
        auto [it, inserted] = containerByFile.try_emplace(node.file, containers.size());
        if (inserted) {
            Container container;
            container.id = containerIdFor(node.file);
            container.file = node.file;
            containers.push_back(std::move(container));
        }
        containers[it->second].memberIds.push_back(node.id);
    }

    LOG_DEBUG("Partitioned {} nodes into {} containers", nodes.size(), containers.size());
    return containers;
}

}  // namespace codemap
