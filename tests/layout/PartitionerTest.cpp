#include <gtest/gtest.h>
#include <codemap/layout/Partitioner.h>

using namespace codemap;

namespace {

GraphNode nodeIn(const std::string& id, const std::string& file) {
    return GraphNode(id, id, NodeKind::Function, file);
}

}  // namespace

TEST(PartitionerTest, OneContainerPerFile_InFirstAppearanceOrder) {
    std::vector<GraphNode> nodes = {
        nodeIn("u1", "utils.py"),
        nodeIn("m1", "main.py"),
        nodeIn("u2", "utils.py"),
        nodeIn("o1", "operations.py"),
        nodeIn("m2", "main.py"),
    };

    std::vector<Container> containers = Partitioner::partition(nodes);

    ASSERT_EQ(containers.size(), 3u);
    EXPECT_EQ(containers[0].file, "utils.py");
    EXPECT_EQ(containers[1].file, "main.py");
    EXPECT_EQ(containers[2].file, "operations.py");

    EXPECT_EQ(containers[0].id, "group-utils.py");
    EXPECT_EQ(containers[0].memberIds, (std::vector<std::string>{"u1", "u2"}));
    EXPECT_EQ(containers[1].memberIds, (std::vector<std::string>{"m1", "m2"}));
}

TEST(PartitionerTest, EveryNodeInExactlyOneContainer) {
    std::vector<GraphNode> nodes;
    for (int i = 0; i < 20; ++i) {
        nodes.push_back(nodeIn("n" + std::to_string(i), "f" + std::to_string(i % 4) + ".py"));
    }

    std::vector<Container> containers = Partitioner::partition(nodes);

    size_t total = 0;
    for (const auto& container : containers) {
        total += container.memberCount();
        for (const auto& id : container.memberIds) {
            int index = std::stoi(id.substr(1));
            EXPECT_EQ(container.file, "f" + std::to_string(index % 4) + ".py");
        }
    }
    EXPECT_EQ(total, nodes.size());
}

TEST(PartitionerTest, EmptyInput_NoContainers) {
    EXPECT_TRUE(Partitioner::partition({}).empty());
}

TEST(PartitionerTest, SameInput_SameContainers) {
    std::vector<GraphNode> nodes = {nodeIn("a", "b.py"), nodeIn("c", "a.py"), nodeIn("d", "b.py")};

    auto first = Partitioner::partition(nodes);
    auto second = Partitioner::partition(nodes);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].id, second[i].id);
        EXPECT_EQ(first[i].memberIds, second[i].memberIds);
    }
}
