#include "core/config_codec.hpp"
#include "core/config_store.hpp"
#include "features/block_scheduler.hpp"
#include "features/page_renderer.hpp"
#include "features/static_generator.hpp"
#include "features/status_routes.hpp"
#include "platform/app_paths.hpp"
#include "platform/http_server.hpp"
#include "platform/logging.hpp"
#include "platform/variable_resolver.hpp"

#include <glib-unix.h>
#include <glibmm.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace {
struct Options {
    bool dry_run = false;
    int interval = 0;
    std::string output_path;
};

gboolean on_terminate_signal(gpointer data) {
    static_cast<Glib::MainLoop*>(data)->quit();
    return G_SOURCE_CONTINUE;
}

void watch_termination(const Glib::RefPtr<Glib::MainLoop>& loop) {
    g_unix_signal_add(SIGINT, on_terminate_signal, loop.get());
    g_unix_signal_add(SIGTERM, on_terminate_signal, loop.get());
}

bool parse_options(int& argc, char**& argv, Options& options) {
    Glib::OptionContext context("- status page built from shell commands");
    Glib::OptionGroup group("dazibao", "Dazibao options", "Show Dazibao options");

    Glib::OptionEntry dry_run;
    dry_run.set_short_name('d');
    dry_run.set_long_name("dry-run");
    dry_run.set_description("Dry run: generate static HTML and exit");
    group.add_entry(dry_run, options.dry_run);

    Glib::OptionEntry interval;
    interval.set_short_name('t');
    interval.set_long_name("interval");
    interval.set_description("Interval in seconds for static page generation");
    interval.set_arg_description("SECONDS");
    group.add_entry(interval, options.interval);

    Glib::OptionEntry output;
    output.set_short_name('o');
    output.set_long_name("output");
    output.set_description("Optional: path to write the generated HTML file");
    output.set_arg_description("PATH");
    group.add_entry_filename(output, options.output_path);

    context.set_main_group(group);
    try {
        context.parse(argc, argv);
    } catch (const Glib::Error& ex) {
        std::cerr << ex.what() << '\n' << context.get_help();
        return false;
    }
    return true;
}

int run_dry(const dazibao::AppPaths& paths, const Options& options) {
    dazibao::StaticPageGenerator generator(paths, dazibao::variables::app_version());
    std::string error;
    if (options.output_path.empty()) {
        auto html = generator.generate(error);
        if (!html) {
            dazibao::logging::error("Failed to generate HTML for dry run: " + error);
            return 1;
        }
        std::cout << *html << std::endl;
        return 0;
    }

    if (!generator.generate_to_file(options.output_path, error)) {
        dazibao::logging::error("Failed to write static page: " + error);
        return 1;
    }
    return 0;
}

int run_interval(const dazibao::AppPaths& paths, const Options& options) {
    dazibao::StaticPageGenerator generator(paths, dazibao::variables::app_version());
    auto generate = [&generator, &options]() {
        dazibao::logging::info("Generating static page...");
        std::string error;
        if (!generator.generate_to_file(options.output_path, error)) {
            dazibao::logging::error("Error generating static page: " + error);
        }
        return true;
    };

    dazibao::logging::info("Starting static page generation every " + std::to_string(options.interval) +
                           " seconds. Press Ctrl+C to stop.");
    generate();

    auto loop = Glib::MainLoop::create();
    Glib::signal_timeout().connect_seconds(generate, static_cast<unsigned int>(options.interval));
    watch_termination(loop);
    loop->run();

    dazibao::logging::info("Received termination signal. Exiting...");
    return 0;
}

int run_server(const dazibao::AppPaths& paths) {
    std::string error;
    bool created = false;
    auto tree = dazibao::load_or_create_configuration(paths.config_file, created, error);
    if (!tree) {
        dazibao::logging::error("Failed to load config file " + paths.config_file + ": " + error);
        return 1;
    }
    if (!created) {
        dazibao::logging::info("Loaded config from: " + paths.config_file);
        dazibao::logging::info("Loaded config content:\n" + dazibao::codec::to_json(*tree, true));
    }
    tree->version = dazibao::variables::app_version();
    const int port = tree->port;

    dazibao::InstanceLock lock;
    if (!lock.acquire(paths.lock_file, error)) {
        dazibao::logging::error(error);
        return 1;
    }

    auto store = std::make_shared<dazibao::ConfigStore>(std::move(*tree), paths.config_file);
    dazibao::PageRenderer renderer(paths.template_file, paths.icon_file);
    dazibao::HttpServer server(port, dazibao::make_status_handler(store, renderer));
    if (!server.start(error)) {
        dazibao::logging::error("Failed to start server: " + error);
        return 1;
    }

    dazibao::SchedulerSupervisor supervisor(store);
    supervisor.start_all();

    dazibao::logging::info("dazibao server running on http://localhost:" + std::to_string(port) +
                           ". To stop, run: kill " + std::to_string(getpid()));

    auto loop = Glib::MainLoop::create();
    watch_termination(loop);
    loop->run();

    dazibao::logging::info("Received termination signal. Releasing lock and exiting...");
    lock.release();
    server.stop();
    supervisor.stop(dazibao::kDefaultStopGrace);
    return 0;
}
}  // namespace

int main(int argc, char* argv[])
{
    Glib::init();

    Options options;
    if (!parse_options(argc, argv, options)) {
        return 1;
    }

    std::string error;
    auto paths = dazibao::resolve_app_paths(error);
    if (!paths) {
        dazibao::logging::error(error);
        return 1;
    }
    if (!dazibao::install_assets(*paths, Glib::get_current_dir(), dazibao::render::default_template(), error)) {
        dazibao::logging::error(error);
        return 1;
    }

    if (options.dry_run) {
        return run_dry(*paths, options);
    }
    if (options.interval > 0) {
        return run_interval(*paths, options);
    }
    return run_server(*paths);
}
