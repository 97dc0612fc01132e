#include "opgraph/operation/Operation.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace opgraph;

TEST(operation, function_operation_invokes_body) {
  auto add = make_operation("add", {"a", "b"}, {"sum"}, [](const ValueMap &in) {
    return ValueMap{
        {"sum", value_cast<int>(in, "a") + value_cast<int>(in, "b")}};
  });
  EXPECT_EQ(add->name(), "add");
  ASSERT_EQ(add->needs().size(), 2u);
  EXPECT_EQ(add->needs()[0], "a");
  EXPECT_EQ(add->provides()[0], "sum");

  ValueMap out = add->invoke(ValueMap{{"a", 2}, {"b", 3}});
  EXPECT_EQ(value_cast<int>(out, "sum"), 5);
}

TEST(operation, positional_operation_zips_results_onto_provides) {
  auto divmod = make_positional_operation(
      "divmod", {"n", "d"}, {"q", "r"}, [](memory::span<const Value> args) {
        const int n = value_cast<int>(args[0]);
        const int d = value_cast<int>(args[1]);
        return memory::vector<Value>{n / d, n % d};
      });
  ValueMap out = divmod->invoke(ValueMap{{"n", 17}, {"d", 5}});
  EXPECT_EQ(value_cast<int>(out, "q"), 3);
  EXPECT_EQ(value_cast<int>(out, "r"), 2);
}

TEST(operation, positional_operation_rejects_wrong_result_count) {
  auto broken = make_positional_operation(
      "broken", {"x"}, {"y", "z"}, [](memory::span<const Value> args) {
        return memory::vector<Value>{args[0]};
      });
  EXPECT_THROW(broken->invoke(ValueMap{{"x", 1}}), std::length_error);
}

TEST(operation, rejects_empty_name) {
  EXPECT_THROW(make_operation("", {"a"}, {"b"},
                              [](const ValueMap &) { return ValueMap{}; }),
               std::invalid_argument);
}

TEST(operation, rejects_duplicate_needs_and_provides) {
  auto body = [](const ValueMap &) { return ValueMap{}; };
  EXPECT_THROW(make_operation("op", {"a", "a"}, {"b"}, body),
               std::invalid_argument);
  EXPECT_THROW(make_operation("op", {"a"}, {"b", "b"}, body),
               std::invalid_argument);
}

TEST(operation, rejects_missing_body) {
  EXPECT_THROW(make_operation("op", {"a"}, {"b"}, nullptr),
               std::invalid_argument);
}

TEST(operation, formats_as_signature) {
  auto op = make_operation("scale", {"x", "k"}, {"y"},
                           [](const ValueMap &) { return ValueMap{}; });
  EXPECT_EQ(fmt::format("{}", *op),
            "Operation(name='scale', needs=[x, k], provides=[y])");
}
