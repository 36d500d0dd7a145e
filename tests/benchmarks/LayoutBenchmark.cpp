#include <codemap/codemap.h>

#include <benchmark/benchmark.h>

#include <random>
#include <string>

using namespace codemap;

// ============================================================================
// Test Data Generation
// ============================================================================

class LayoutBenchmarkFixture : public benchmark::Fixture {
protected:
    void SetUp(const ::benchmark::State& state) override {
        const int numNodes = static_cast<int>(state.range(0));
        const int numFiles = static_cast<int>(state.range(1));
        generateTestData(numNodes, numFiles);
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        graph_ = CodeGraph{};
    }

    void generateTestData(int numNodes, int numFiles) {
        std::mt19937 rng(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<int> fileDist(0, numFiles - 1);
        std::uniform_int_distribution<int> kindDist(0, 4);

        for (int i = 0; i < numNodes; ++i) {
            std::string id = "n" + std::to_string(i);
            graph_.nodes.emplace_back(id, id, static_cast<NodeKind>(kindDist(rng)),
                                      "file" + std::to_string(fileDist(rng)) + ".py", i);
        }

        // About two calls per declaration
        std::uniform_int_distribution<int> nodeDist(0, numNodes - 1);
        for (int i = 0; i < numNodes * 2; ++i) {
            graph_.edges.emplace_back("n" + std::to_string(nodeDist(rng)),
                                      "n" + std::to_string(nodeDist(rng)));
        }
    }

    CodeGraph graph_;
};

BENCHMARK_DEFINE_F(LayoutBenchmarkFixture, FullPass)(benchmark::State& state) {
    CodeGraphLayout engine;
    for (auto _ : state) {
        LayoutResult result = engine.layout(graph_);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * graph_.nodeCount());
}

// (nodes, files)
BENCHMARK_REGISTER_F(LayoutBenchmarkFixture, FullPass)
    ->Args({30, 3})     // Small project
    ->Args({200, 10})   // Medium
    ->Args({1000, 25}); // Large

BENCHMARK_DEFINE_F(LayoutBenchmarkFixture, SerializeResult)(benchmark::State& state) {
    CodeGraphLayout engine;
    LayoutResult result = engine.layout(graph_);
    for (auto _ : state) {
        std::string json = LayoutSerializer::toJson(result);
        benchmark::DoNotOptimize(json);
    }
}

BENCHMARK_REGISTER_F(LayoutBenchmarkFixture, SerializeResult)
    ->Args({200, 10});

BENCHMARK_MAIN();
