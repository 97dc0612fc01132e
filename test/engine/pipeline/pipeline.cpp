#include "opgraph/opgraph.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace opgraph;

using Names = memory::vector<memory::string>;

static OperationHandle add_op() {
  return make_operation("add", {"a", "b"}, {"sum"}, [](const ValueMap &in) {
    return ValueMap{
        {"sum", value_cast<int>(in, "a") + value_cast<int>(in, "b")}};
  });
}

static OperationHandle double_op() {
  return make_operation("double", {"sum"}, {"doubled"}, [](const ValueMap &in) {
    return ValueMap{{"doubled", 2 * value_cast<int>(in, "sum")}};
  });
}

static OperationHandle triple_op() {
  return make_operation("triple", {"doubled"}, {"tripled"},
                        [](const ValueMap &in) {
                          return ValueMap{
                              {"tripled", 3 * value_cast<int>(in, "doubled")}};
                        });
}

TEST(pipeline, needs_and_provides_follow_the_network) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  EXPECT_EQ(pipe->name(), "arith");
  EXPECT_EQ(pipe->needs(), (Names{"a", "b"}));
  EXPECT_EQ(pipe->provides(), (Names{"sum", "doubled"}));
  EXPECT_EQ(pipe->network().operationCount(), 2u);
}

TEST(pipeline, compute_returns_requested_outputs_only) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  ExecutionResult result =
      pipe->compute(ValueMap{{"a", 2}, {"b", 3}}, {"doubled"});
  ASSERT_EQ(result.solution.values.size(), 1u);
  EXPECT_EQ(value_cast<int>(result.solution.values, "doubled"), 10);
  EXPECT_TRUE(result.overwrites.empty());
}

TEST(pipeline, compute_without_outputs_returns_everything) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  ExecutionResult result = pipe->compute(ValueMap{{"a", 2}, {"b", 3}});
  EXPECT_EQ(result.solution.values.size(), 4u);
  EXPECT_EQ(value_cast<int>(result.solution.values, "sum"), 5);
  EXPECT_EQ(value_cast<int>(result.solution.values, "doubled"), 10);
}

TEST(pipeline, plans_are_cached_per_request) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  EXPECT_EQ(pipe->cachedPlanCount(), 0u);

  pipe->compute(ValueMap{{"a", 1}, {"b", 1}}, {"doubled"});
  EXPECT_EQ(pipe->cachedPlanCount(), 1u);

  // Same request, different values and input order.
  Plan plan = pipe->compile({"b", "a"}, {"doubled"});
  EXPECT_EQ(pipe->cachedPlanCount(), 1u);
  EXPECT_EQ(plan.stepNames(), (Names{"add", "double"}));

  pipe->compute(ValueMap{{"a", 1}, {"b", 1}}, {"sum"});
  EXPECT_EQ(pipe->cachedPlanCount(), 2u);

  pipe->compute(ValueMap{{"sum", 4}}, {"doubled"});
  EXPECT_EQ(pipe->cachedPlanCount(), 3u);
}

TEST(pipeline, output_order_and_duplicates_share_a_plan) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  ExecutionResult first =
      pipe->compute(ValueMap{{"a", 2}, {"b", 3}}, {"sum", "doubled"});
  ExecutionResult second =
      pipe->compute(ValueMap{{"b", 3}, {"a", 2}}, {"doubled", "sum", "sum"});
  EXPECT_EQ(pipe->cachedPlanCount(), 1u);
  ASSERT_EQ(second.solution.values.size(), 2u);
  EXPECT_EQ(value_cast<int>(first.solution.values, "sum"),
            value_cast<int>(second.solution.values, "sum"));
  EXPECT_EQ(value_cast<int>(second.solution.values, "doubled"), 10);
}

TEST(pipeline, failed_compile_is_not_cached) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  EXPECT_THROW(pipe->compute(ValueMap{{"a", 1}}, {"doubled"}),
               UnsatisfiableOutputError);
  EXPECT_EQ(pipe->cachedPlanCount(), 0u);
}

TEST(pipeline, concurrent_computations_share_the_cache) {
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()});
  memory::vector<int> results(8, 0);
  memory::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      ExecutionResult r =
          pipe->compute(ValueMap{{"a", i}, {"b", 1}}, {"doubled"});
      results[static_cast<std::size_t>(i)] =
          value_cast<int>(r.solution.values, "doubled");
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ(results[static_cast<std::size_t>(i)], 2 * (i + 1));
  }
  EXPECT_EQ(pipe->cachedPlanCount(), 1u);
}

TEST(pipeline, execution_method_can_be_switched) {
  Options options;
  options.execution.method = ExecutionMethod::Parallel;
  auto pipe = Pipeline::compose("arith", {add_op(), double_op()}, options);
  EXPECT_EQ(pipe->executionMethod(), ExecutionMethod::Parallel);
  auto parallel = pipe->compute(ValueMap{{"a", 2}, {"b", 3}}, {"doubled"});

  pipe->setExecutionMethod(ExecutionMethod::Sequential);
  EXPECT_EQ(pipe->executionMethod(), ExecutionMethod::Sequential);
  auto sequential = pipe->compute(ValueMap{{"a", 2}, {"b", 3}}, {"doubled"});

  EXPECT_EQ(value_cast<int>(parallel.solution.values, "doubled"),
            value_cast<int>(sequential.solution.values, "doubled"));
  EXPECT_EQ(pipe->options().execution.method, ExecutionMethod::Parallel);
}

TEST(pipeline, nests_as_an_operation) {
  OperationHandle inner = Pipeline::compose("inner", {add_op(), double_op()});
  auto outer = Pipeline::compose("outer", {inner, triple_op()});

  EXPECT_EQ(outer->needs(), (Names{"a", "b"}));
  ExecutionResult result =
      outer->compute(ValueMap{{"a", 1}, {"b", 2}}, {"tripled"});
  EXPECT_EQ(value_cast<int>(result.solution.values, "tripled"), 18);

  ValueMap direct = inner->invoke(ValueMap{{"a", 1}, {"b", 2}});
  EXPECT_EQ(direct.size(), 2u);
  EXPECT_EQ(value_cast<int>(direct, "sum"), 3);
  EXPECT_EQ(value_cast<int>(direct, "doubled"), 6);
}

TEST(pipeline, inner_failure_propagates) {
  auto fail = make_operation("fail", {"sum"}, {"never"},
                             [](const ValueMap &) -> ValueMap {
                               throw std::runtime_error("inner boom");
                             });
  OperationHandle inner = Pipeline::compose("inner", {add_op(), fail});
  auto outer = Pipeline::compose("outer", {inner});
  try {
    outer->compute(ValueMap{{"a", 1}, {"b", 2}}, {"never"});
    FAIL() << "expected OperationExecutionError";
  } catch (const OperationExecutionError &e) {
    EXPECT_EQ(e.operation(), "inner");
    try {
      e.rethrowCause();
    } catch (const OperationExecutionError &cause) {
      EXPECT_EQ(cause.operation(), "fail");
    }
  }
}

TEST(pipeline, default_options_keep_the_log_level) {
  const diag::LogLevel before = diag::log_level();
  diag::set_log_level(diag::LogLevel::Trace);

  auto outer = Pipeline::compose(
      "outer", {Pipeline::compose("inner", {add_op()}), double_op()});
  EXPECT_EQ(diag::log_level(), diag::LogLevel::Trace);

  Options options;
  options.logLevel = diag::LogLevel::Warn;
  auto quiet = Pipeline::compose("quiet", {add_op()}, options);
  EXPECT_EQ(diag::log_level(), diag::LogLevel::Warn);

  diag::set_log_level(before);
}

TEST(pipeline, nested_failure_salvages_inner_values) {
  auto fail = make_operation("fail", {"sum"}, {"never"},
                             [](const ValueMap &) -> ValueMap {
                               throw std::runtime_error("inner boom");
                             });
  OperationHandle inner = Pipeline::compose("inner", {add_op(), fail});
  auto outer = Pipeline::compose("outer", {inner});
  try {
    outer->compute(ValueMap{{"a", 40}, {"b", 2}}, {"never"});
    FAIL() << "expected OperationExecutionError";
  } catch (const OperationExecutionError &e) {
    EXPECT_EQ(value_cast<int>(e.inputs(), "a"), 40);
    try {
      e.rethrowCause();
    } catch (const OperationExecutionError &cause) {
      EXPECT_EQ(value_cast<int>(cause.inputs(), "sum"), 42);
    }
  }
}
