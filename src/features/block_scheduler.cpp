#include "features/block_scheduler.hpp"

#include "platform/logging.hpp"

#include <pthread.h>

#include <utility>

namespace dazibao {
namespace {
std::string run_one(const CommandExecutor& executor, const std::string& command, const std::string& context) {
    ExecutionResult result = executor.execute(command);
    if (!result.success) {
        logging::error("Error executing command " + context + " (command: " + command + "): " + result.error);
    }
    return format_output(result);
}

struct OutputWriter {
    const std::vector<std::string>& outputs;

    bool operator()(SingleBody& single) const {
        if (outputs.size() != 1) {
            return false;
        }
        single.output = outputs.front();
        return true;
    }

    bool operator()(GroupBody& group) const {
        if (outputs.size() != group.commands.size()) {
            return false;
        }
        for (size_t i = 0; i < outputs.size(); ++i) {
            group.commands[i].output = outputs[i];
        }
        return true;
    }
};
}  // namespace

std::vector<std::string> execute_block(const Block& block, const CommandExecutor& executor) {
    std::vector<std::string> outputs;
    if (const auto* single = std::get_if<SingleBody>(&block.body)) {
        outputs.push_back(run_one(executor, single->command, "for block '" + block.title + "'"));
    } else if (const auto* group = std::get_if<GroupBody>(&block.body)) {
        outputs.reserve(group->commands.size());
        for (const auto& spec : group->commands) {
            outputs.push_back(run_one(executor, spec.command,
                                      "'" + spec.label + "' in group '" + block.title + "'"));
        }
    }
    return outputs;
}

bool apply_tick(ConfigurationTree& tree, std::size_t index, const std::vector<std::string>& outputs) {
    if (index >= tree.blocks.size()) {
        return false;
    }

    Block& block = tree.blocks[index];
    if (!std::visit(OutputWriter{outputs}, block.body)) {
        return false;
    }

    block.last_updated = next_timestamp_after(block.last_updated);
    tree.last_updated = next_timestamp_after(tree.last_updated);
    if (tree.last_updated < block.last_updated) {
        tree.last_updated = block.last_updated;
    }
    return true;
}

bool run_tick(ConfigStore& store, std::size_t index, const Block& block, const CommandExecutor& executor) {
    const std::vector<std::string> outputs = execute_block(block, executor);

    bool applied = false;
    store.mutate([&](ConfigurationTree& tree) {
        applied = apply_tick(tree, index, outputs);
    });
    if (!applied) {
        logging::error("Block '" + block.title + "' no longer matches the configuration; tick dropped");
    }
    return applied;
}

BlockScheduler::BlockScheduler(std::shared_ptr<ConfigStore> store, std::size_t index, Block block,
                               CommandExecutor executor)
    : m_store(std::move(store)),
      m_state(std::make_shared<State>()),
      m_index(index),
      m_block(std::move(block)),
      m_executor(executor),
      m_name("block-" + std::to_string(index)) {}

BlockScheduler::~BlockScheduler() {
    request_stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void BlockScheduler::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread(&BlockScheduler::run_loop, m_store, m_state, m_index, m_block, m_executor);
    pthread_setname_np(m_thread.native_handle(), m_name.substr(0, 15).c_str());
}

void BlockScheduler::request_stop() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stop_requested = true;
    }
    m_state->cv.notify_all();
}

bool BlockScheduler::wait_finished(std::chrono::steady_clock::time_point deadline) {
    if (!m_thread.joinable()) {
        return true;
    }
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->cv.wait_until(lock, deadline, [this]() { return m_state->finished; });
}

void BlockScheduler::release_thread() {
    if (!m_thread.joinable()) {
        return;
    }

    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        finished = m_state->finished;
    }

    if (finished) {
        m_thread.join();
    } else {
        logging::warning("Scheduler for block '" + m_block.title + "' is still running a command; abandoning it");
        m_thread.detach();
    }
}

std::size_t BlockScheduler::ticks_completed() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->ticks;
}

void BlockScheduler::run_loop(std::shared_ptr<ConfigStore> store, std::shared_ptr<State> state,
                              std::size_t index, Block block, CommandExecutor executor) {
    const auto interval = std::chrono::seconds(block.interval);
    auto next_tick = std::chrono::steady_clock::now();

    while (true) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stop_requested) {
                break;
            }
        }

        run_tick(*store, index, block, executor);

        std::unique_lock<std::mutex> lock(state->mutex);
        ++state->ticks;

        next_tick += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick <= now) {
            next_tick = now;
        }
        if (state->cv.wait_until(lock, next_tick, [&state]() { return state->stop_requested; })) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
    }
    state->cv.notify_all();
}

SchedulerSupervisor::SchedulerSupervisor(std::shared_ptr<ConfigStore> store)
    : m_store(std::move(store)) {}

SchedulerSupervisor::~SchedulerSupervisor() {
    stop(kDefaultStopGrace);
}

void SchedulerSupervisor::start_all() {
    if (!m_schedulers.empty()) {
        return;
    }

    const ConfigurationTree tree = m_store->snapshot();
    for (std::size_t i = 0; i < tree.blocks.size(); ++i) {
        m_schedulers.push_back(std::make_unique<BlockScheduler>(m_store, i, tree.blocks[i]));
    }
    for (auto& scheduler : m_schedulers) {
        scheduler->start();
    }
}

void SchedulerSupervisor::stop(std::chrono::milliseconds grace) {
    for (auto& scheduler : m_schedulers) {
        scheduler->request_stop();
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    for (auto& scheduler : m_schedulers) {
        scheduler->wait_finished(deadline);
        scheduler->release_thread();
    }
    m_schedulers.clear();
}
}  // namespace dazibao
