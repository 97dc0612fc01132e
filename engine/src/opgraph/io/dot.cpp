#include "opgraph/io/dot.hpp"
#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/vector.hpp"
#include <fmt/format.h>
#include <iterator>

namespace opgraph::io {

namespace {

enum class Highlight {
  None,
  Input,
  Output,
  Pruned,
};

struct DotStyle {
  memory::vector<Highlight> data;
  memory::vector<Highlight> operations;
  // 0 if the operation is not a step.
  memory::vector<std::size_t> stepNumber;
};

memory::string escape(const memory::string &label) {
  memory::string out;
  out.reserve(label.size());
  for (char c : label) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

const char *data_attributes(Highlight highlight) {
  switch (highlight) {
  case Highlight::Input:
    return ", style=filled, fillcolor=\"#c6e2ff\"";
  case Highlight::Output:
    return ", style=filled, fillcolor=\"#c1f0c1\"";
  case Highlight::Pruned:
    return ", color=grey, fontcolor=grey";
  case Highlight::None:
    break;
  }
  return "";
}

memory::string render(const Network &network, const DotStyle &style) {
  memory::string dot = "digraph opgraph {\n  rankdir=LR;\n";
  auto out = std::back_inserter(dot);

  for (std::size_t n = 0; n < network.dataCount(); ++n) {
    fmt::format_to(out, "  d{} [shape=ellipse, label=\"{}\"{}];\n", n,
                   escape(network.dataName(memory::NodeId{n})),
                   data_attributes(style.data[n]));
  }

  for (std::size_t e = 0; e < network.operationCount(); ++e) {
    const memory::EdgeId op{e};
    const bool pruned = style.operations[e] == Highlight::Pruned;
    const memory::string name = escape(network.operation(op).name());
    if (style.stepNumber[e] != 0) {
      fmt::format_to(out, "  o{} [shape=box, label=\"{}. {}\"];\n", e,
                     style.stepNumber[e], name);
    } else {
      fmt::format_to(out, "  o{} [shape=box, label=\"{}\"{}];\n", e, name,
                     pruned ? ", color=grey, fontcolor=grey" : "");
    }
    const char *edgeAttr = pruned ? " [color=grey]" : "";
    for (memory::NodeId need : network.needs(op)) {
      fmt::format_to(out, "  d{} -> o{}{};\n", *need, e, edgeAttr);
    }
    for (memory::NodeId provide : network.provides(op)) {
      fmt::format_to(out, "  o{} -> d{}{};\n", e, *provide, edgeAttr);
    }
  }

  dot += "}\n";
  return dot;
}

} // namespace

memory::string to_dot(const Network &network) {
  DotStyle style;
  style.data.assign(network.dataCount(), Highlight::None);
  style.operations.assign(network.operationCount(), Highlight::None);
  style.stepNumber.assign(network.operationCount(), 0);
  return render(network, style);
}

memory::string to_dot(const Plan &plan) {
  const Network &network = plan.network();
  DotStyle style;
  style.data.assign(network.dataCount(), Highlight::Pruned);
  style.operations.assign(network.operationCount(), Highlight::Pruned);
  style.stepNumber.assign(network.operationCount(), 0);

  for (std::size_t i = 0; i < plan.size(); ++i) {
    const memory::EdgeId op = plan.steps()[i];
    style.operations[*op] = Highlight::None;
    style.stepNumber[*op] = i + 1;
    for (memory::NodeId n : network.needs(op)) {
      style.data[*n] = Highlight::None;
    }
    for (memory::NodeId n : network.provides(op)) {
      style.data[*n] = Highlight::None;
    }
  }
  for (const auto &input : plan.requiredInputs()) {
    if (auto id = network.findData(input); id.has_value()) {
      style.data[**id] = Highlight::Input;
    }
  }
  // An output passed through from the inputs is drawn as an output.
  for (const auto &output : plan.providedOutputs()) {
    if (auto id = network.findData(output); id.has_value()) {
      style.data[**id] = Highlight::Output;
    }
  }
  return render(network, style);
}

} // namespace opgraph::io
