#include "core/config_codec.hpp"
#include "core/config_store.hpp"
#include "test_support.hpp"

#include <glibmm/fileutils.h>
#include <glibmm/init.h>
#include <glibmm/miscutils.h>

#include <atomic>
#include <cassert>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
dazibao::ConfigurationTree group_tree() {
    dazibao::ConfigurationTree tree;
    tree.port = 8080;
    dazibao::Block block;
    block.title = "Group";
    block.interval = 1;
    block.body = dazibao::GroupBody{{{"a", "echo a", "0"}, {"b", "echo b", "0"}, {"c", "echo c", "0"}}};
    tree.blocks.push_back(block);
    return tree;
}
}  // namespace

int main() {
    Glib::init();
    const std::string dir = test_support::make_temp_dir();
    const std::string path = Glib::build_filename(dir, "config.json");

    {
        dazibao::ConfigStore store(group_tree(), path);
        auto copy = store.snapshot();
        std::get<dazibao::GroupBody>(copy.blocks[0].body).commands[0].output = "changed";
        assert(std::get<dazibao::GroupBody>(store.snapshot().blocks[0].body).commands[0].output == "0");
    }

    {
        dazibao::ConfigStore store(group_tree(), path);
        bool persisted = store.mutate([](dazibao::ConfigurationTree& tree) {
            std::get<dazibao::GroupBody>(tree.blocks[0].body).commands[1].output = "written";
            tree.version = "1.2-test";
        });
        assert(persisted);

        std::string error;
        auto loaded = dazibao::codec::load_from_file(path, error);
        assert(loaded.has_value());
        assert(*loaded == store.snapshot());
        assert(std::get<dazibao::GroupBody>(loaded->blocks[0].body).commands[1].output == "written");
    }

    {
        dazibao::ConfigStore store(group_tree(), Glib::build_filename(dir, "missing", "config.json"));
        bool persisted = store.mutate([](dazibao::ConfigurationTree& tree) {
            tree.version = "kept in memory";
        });
        assert(!persisted);
        assert(store.snapshot().version == "kept in memory");
    }

    {
        const std::string fresh = Glib::build_filename(dir, "fresh.json");
        bool created = false;
        std::string error;
        auto tree = dazibao::load_or_create_configuration(fresh, created, error);
        assert(tree.has_value());
        assert(created);
        assert(Glib::file_test(fresh, Glib::FileTest::EXISTS));
        assert(tree->blocks.size() == 3);
        assert(tree->port == 8080);

        auto again = dazibao::load_or_create_configuration(fresh, created, error);
        assert(again.has_value());
        assert(!created);
        assert(*again == *tree);
    }

    {
        const std::string broken = Glib::build_filename(dir, "broken.json");
        Glib::file_set_contents(broken, "{ not json");
        bool created = false;
        std::string error;
        assert(!dazibao::load_or_create_configuration(broken, created, error).has_value());
        assert(!created);
        assert(!error.empty());
    }

    {
        // Readers must see every slot of the block from the same mutation.
        auto store = std::make_shared<dazibao::ConfigStore>(group_tree(), path);
        std::atomic<bool> done{false};
        std::atomic<int> mixed{0};

        std::vector<std::thread> readers;
        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&store, &done, &mixed]() {
                while (!done) {
                    auto tree = store->snapshot();
                    const auto& commands = std::get<dazibao::GroupBody>(tree.blocks[0].body).commands;
                    if (commands[0].output != commands[1].output || commands[1].output != commands[2].output) {
                        ++mixed;
                    }
                }
            });
        }

        for (int tick = 1; tick <= 200; ++tick) {
            store->mutate([tick](dazibao::ConfigurationTree& tree) {
                auto& commands = std::get<dazibao::GroupBody>(tree.blocks[0].body).commands;
                for (auto& spec : commands) {
                    spec.output = std::to_string(tick);
                }
            });
        }
        done = true;
        for (auto& reader : readers) {
            reader.join();
        }

        assert(mixed == 0);
        assert(std::get<dazibao::GroupBody>(store->snapshot().blocks[0].body).commands[2].output == "200");
    }

    test_support::remove_tree(dir);
    return 0;
}
