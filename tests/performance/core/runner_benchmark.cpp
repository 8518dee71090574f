#include "algoharness/core/native_test_runner.h"
#include "algoharness/core/problem_families.h"
#include "algoharness/core/simulated_test_runner.h"
#include <benchmark/benchmark.h>

using namespace algoharness;
using namespace algoharness::core;

namespace {

std::vector<TestCase> coinCases(std::size_t count) {
    std::vector<TestCase> cases;
    for (std::size_t i = 0; i < count; ++i) {
        TestCase testCase;
        testCase.input = Value{{"coins", {1, 5, 10, 25}}, {"amount", static_cast<int64_t>(100 + i % 16)}};
        testCase.expected = 4;
        cases.push_back(std::move(testCase));
    }
    return cases;
}

} // namespace

static void BM_CoinChangeSolver(benchmark::State& state) {
    const std::vector<int64_t> coins = {1, 5, 10, 25, 50};
    const auto amount = static_cast<int64_t>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(coinChange(coins, amount));
    }
}
BENCHMARK(BM_CoinChangeSolver)->RangeMultiplier(10)->Range(100, 1000000);

static void BM_ClassifyInput(benchmark::State& state) {
    const Value input = Value::parse(R"({"weights": [1, 2, 3], "values": [4, 5, 6], "capacity": 5})");
    for (auto _ : state) {
        benchmark::DoNotOptimize(classifyInput(input));
    }
}
BENCHMARK(BM_ClassifyInput);

// Repeated inputs within a run are answered from the memo
class SimulatedRunnerBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State& state) override {
        cases_ = coinCases(static_cast<std::size_t>(state.range(0)));
    }

    void TearDown(const benchmark::State&) override {
        cases_.clear();
    }

    std::vector<TestCase> cases_;
};

BENCHMARK_DEFINE_F(SimulatedRunnerBenchmark, RunCatalog)(benchmark::State& state) {
    SimulatedTestRunner runner("Python");
    for (auto _ : state) {
        auto results = runner.runTests("def coin_change(coins, amount): pass", cases_);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(SimulatedRunnerBenchmark, RunCatalog)->Arg(16)->Arg(256);

// Dominated by per-case engine setup and the worker thread
static void BM_NativeRunnerPerCase(benchmark::State& state) {
    NativeTestRunner runner;
    TestCase testCase;
    testCase.input = Value{{"n", 20}};
    testCase.expected = 10946;
    const std::vector<TestCase> cases(static_cast<std::size_t>(state.range(0)), testCase);
    const std::string code = R"(
function climbStairs(n) {
    let a = 1, b = 1;
    for (let i = 2; i <= n; i++) { const c = a + b; a = b; b = c; }
    return b;
})";

    for (auto _ : state) {
        auto results = runner.runTests(code, cases);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_NativeRunnerPerCase)->Arg(1)->Arg(16)->Unit(benchmark::kMillisecond);
