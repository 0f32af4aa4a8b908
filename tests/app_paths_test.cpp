#include "platform/app_paths.hpp"
#include "test_support.hpp"

#include <glibmm/fileutils.h>
#include <glibmm/init.h>
#include <glibmm/miscutils.h>

#include <cassert>
#include <string>
#include <unistd.h>

int main() {
    Glib::init();
    const std::string root = test_support::make_temp_dir();

    {
        auto paths = dazibao::app_paths_for("/srv/dazibao");
        assert(paths.config_file == "/srv/dazibao/config.json");
        assert(paths.template_file == "/srv/dazibao/template.html");
        assert(paths.icon_file == "/srv/dazibao/icons/dazibao.png");
        assert(paths.lock_file == "/srv/dazibao/dazibao.lock");
        assert(paths.static_page == "/srv/dazibao/index.html");
    }

    {
        std::string error;
        auto paths = dazibao::resolve_app_paths(error);
        assert(paths.has_value());
        assert(paths->data_dir == Glib::build_filename(Glib::get_home_dir(), ".dazibao"));
    }

    {
        const std::string source = Glib::build_filename(root, "source");
        const auto paths = dazibao::app_paths_for(Glib::build_filename(root, "data", "nested"));
        std::string error;
        assert(dazibao::ensure_directory(source, error));

        assert(dazibao::install_assets(paths, source, "<html>fallback</html>", error));
        assert(Glib::file_get_contents(paths.template_file) == "<html>fallback</html>");

        // An existing template is left alone when the source has none.
        Glib::file_set_contents(paths.template_file, "<html>edited</html>");
        assert(dazibao::install_assets(paths, source, "<html>fallback</html>", error));
        assert(Glib::file_get_contents(paths.template_file) == "<html>edited</html>");

        Glib::file_set_contents(Glib::build_filename(source, "template.html"), "<html>shipped</html>");
        assert(dazibao::ensure_directory(Glib::build_filename(source, "icons"), error));
        Glib::file_set_contents(Glib::build_filename(source, "icons", "dazibao.png"), "png");
        assert(dazibao::install_assets(paths, source, "<html>fallback</html>", error));
        assert(Glib::file_get_contents(paths.template_file) == "<html>shipped</html>");
        assert(Glib::file_get_contents(paths.icon_file) == "png");
    }

    {
        const std::string target = Glib::build_filename(root, "out", "deeper", "index.html");
        std::string error;
        assert(dazibao::write_file_with_parents(target, "page", error));
        assert(Glib::file_get_contents(target) == "page");
    }

    {
        const std::string lock_path = Glib::build_filename(root, "dazibao.lock");
        std::string error;

        dazibao::InstanceLock first;
        assert(first.acquire(lock_path, error));
        assert(first.held());
        assert(Glib::file_get_contents(lock_path) == std::to_string(getpid()));

        dazibao::InstanceLock second;
        assert(!second.acquire(lock_path, error));
        assert(error.find("Another instance") != std::string::npos);
        assert(!second.held());

        first.release();
        assert(!first.held());
        assert(!Glib::file_test(lock_path, Glib::FileTest::EXISTS));

        {
            dazibao::InstanceLock scoped;
            assert(scoped.acquire(lock_path, error));
        }
        assert(!Glib::file_test(lock_path, Glib::FileTest::EXISTS));
    }

    test_support::remove_tree(root);
    return 0;
}
