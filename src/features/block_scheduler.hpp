#ifndef DAZIBAO_FEATURES_BLOCK_SCHEDULER_HPP
#define DAZIBAO_FEATURES_BLOCK_SCHEDULER_HPP

#include "core/config_store.hpp"
#include "core/models.hpp"
#include "platform/command_executor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dazibao {
// Runs every command of the block in declared order, one output per slot.
// Never touches the store.
std::vector<std::string> execute_block(const Block& block, const CommandExecutor& executor);

// Writes one tick's outputs into tree.blocks[index] and stamps it.
bool apply_tick(ConfigurationTree& tree, std::size_t index, const std::vector<std::string>& outputs);

// Executes the block outside the lock, then commits the tick with one mutate().
bool run_tick(ConfigStore& store, std::size_t index, const Block& block,
              const CommandExecutor& executor = CommandExecutor());

class BlockScheduler {
public:
    BlockScheduler(std::shared_ptr<ConfigStore> store, std::size_t index, Block block,
                   CommandExecutor executor = CommandExecutor());
    ~BlockScheduler();

    BlockScheduler(const BlockScheduler&) = delete;
    BlockScheduler& operator=(const BlockScheduler&) = delete;

    void start();
    void request_stop();
    bool wait_finished(std::chrono::steady_clock::time_point deadline);
    // Joins a finished thread, detaches one still stuck in a command.
    void release_thread();

    const std::string& name() const { return m_name; }
    std::size_t ticks_completed() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool stop_requested = false;
        bool finished = false;
        std::size_t ticks = 0;
    };

    static void run_loop(std::shared_ptr<ConfigStore> store, std::shared_ptr<State> state,
                         std::size_t index, Block block, CommandExecutor executor);

    std::shared_ptr<ConfigStore> m_store;
    std::shared_ptr<State> m_state;
    std::size_t m_index;
    Block m_block;
    CommandExecutor m_executor;
    std::string m_name;
    std::thread m_thread;
};

constexpr std::chrono::milliseconds kDefaultStopGrace{2000};

// Owns one scheduler thread per block for the life of the process.
class SchedulerSupervisor {
public:
    explicit SchedulerSupervisor(std::shared_ptr<ConfigStore> store);
    ~SchedulerSupervisor();

    void start_all();
    void stop(std::chrono::milliseconds grace);

    std::size_t size() const { return m_schedulers.size(); }
    const BlockScheduler& scheduler(std::size_t index) const { return *m_schedulers.at(index); }

private:
    std::shared_ptr<ConfigStore> m_store;
    std::vector<std::unique_ptr<BlockScheduler>> m_schedulers;
};
}  // namespace dazibao

#endif
