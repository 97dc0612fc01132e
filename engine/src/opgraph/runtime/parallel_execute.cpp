#include "opgraph/runtime/parallel_execute.hpp"
#include "opgraph/diag/logging.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/runtime/execute.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace opgraph::details::runtime {

namespace {

struct StepSlot {
  bool done = false;
  memory::optional<ValueMap> outputs;
  std::exception_ptr error;
};

struct SharedState {
  std::mutex mutex;
  std::condition_variable workAvailable;
  std::condition_variable stepFinished;
  std::priority_queue<std::size_t, memory::vector<std::size_t>,
                      std::greater<std::size_t>>
      ready;
  memory::vector<StepSlot> slots;
  std::size_t inFlight = 0;
  bool failed = false;
  bool stop = false;
};

// Joins all workers on scope exit, also when the coordinator throws.
class WorkerThreads {
public:
  explicit WorkerThreads(SharedState &state) : m_state(state) {}

  WorkerThreads(const WorkerThreads &) = delete;
  WorkerThreads &operator=(const WorkerThreads &) = delete;

  ~WorkerThreads() {
    {
      std::lock_guard<std::mutex> lock(m_state.mutex);
      m_state.stop = true;
    }
    m_state.workAvailable.notify_all();
    for (auto &thread : m_threads) {
      thread.join();
    }
  }

  template <typename F> void spawn(F &&f) {
    m_threads.emplace_back(std::forward<F>(f));
  }

private:
  SharedState &m_state;
  memory::vector<std::thread> m_threads;
};

void worker_loop(const Plan &plan, SharedState &state, const ValueMap &store) {
  while (true) {
    std::size_t step;
    ValueMap inputs;
    {
      std::unique_lock<std::mutex> lock(state.mutex);
      state.workAvailable.wait(
          lock, [&] { return state.stop || !state.ready.empty(); });
      if (state.stop) {
        return;
      }
      step = state.ready.top();
      state.ready.pop();
      // The store is only mutated by the coordinator while holding the lock.
      try {
        inputs = gather_inputs(plan, step, store);
      } catch (...) {
        state.slots[step].error = std::current_exception();
        state.slots[step].done = true;
        state.failed = true;
        state.stepFinished.notify_one();
        continue;
      }
      ++state.inFlight;
    }

    memory::optional<ValueMap> outputs;
    std::exception_ptr error;
    try {
      outputs = invoke_step(plan, step, inputs);
    } catch (...) {
      error = std::current_exception();
    }

    {
      std::lock_guard<std::mutex> lock(state.mutex);
      StepSlot &slot = state.slots[step];
      slot.outputs = std::move(outputs);
      slot.error = error;
      slot.done = true;
      state.failed = state.failed || error != nullptr;
      --state.inFlight;
    }
    state.stepFinished.notify_one();
  }
}

} // namespace

ExecutionResult execute_parallel(const Plan &plan, ValueMap values,
                                 unsigned int workerCount) {
  const std::size_t stepCount = plan.size();
  std::size_t workers = workerCount;
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }
  workers = std::min(workers, stepCount);

  OPGRAPH_DEBUG("executing {} steps on {} worker threads", stepCount, workers);

  ExecutionResult result;
  result.solution.values = std::move(values);
  ValueMap &store = result.solution.values;

  SharedState state;
  state.slots.resize(stepCount);
  memory::vector<std::size_t> pending(stepCount, 0);
  for (std::size_t i = 0; i < stepCount; ++i) {
    pending[i] = plan.dependencies(i).size();
    if (pending[i] == 0) {
      state.ready.push(i);
    }
  }

  {
    WorkerThreads threads(state);
    for (std::size_t w = 0; w < workers; ++w) {
      threads.spawn([&] { worker_loop(plan, state, store); });
    }

    std::unique_lock<std::mutex> lock(state.mutex);
    for (std::size_t next = 0; next < stepCount; ++next) {
      state.stepFinished.wait(
          lock, [&] { return state.slots[next].done || state.failed; });
      if (state.failed) {
        // Stop scheduling, but let started steps finish.
        state.stop = true;
        state.workAvailable.notify_all();
        state.stepFinished.wait(lock, [&] { return state.inFlight == 0; });
        break;
      }

      StepSlot &slot = state.slots[next];
      merge_outputs(plan, next, std::move(*slot.outputs), store,
                    result.overwrites);
      slot.outputs.reset();

      bool released = false;
      for (std::size_t dependent : plan.dependents(next)) {
        if (--pending[dependent] == 0) {
          state.ready.push(dependent);
          released = true;
        }
      }
      if (released) {
        state.workAvailable.notify_all();
      }
    }
    lock.unlock();
  }

  if (state.failed) {
    for (const StepSlot &slot : state.slots) {
      if (slot.error) {
        std::rethrow_exception(slot.error);
      }
    }
  }
  return result;
}

} // namespace opgraph::details::runtime
