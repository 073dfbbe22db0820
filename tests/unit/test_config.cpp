#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>

using namespace hue::backend;
namespace fs = std::filesystem;

namespace {

fs::path write_config(const std::string& name, const std::string& content) {
    auto path = fs::temp_directory_path() / name;
    std::ofstream f(path);
    f << content;
    return path;
}

}  // namespace

TEST_CASE(test_defaults) {
    Config cfg;
    ASSERT_EQ(cfg.default_theme, std::string("monokai"));
    ASSERT_TRUE(cfg.themes_dir == fs::path("themes.d"));
    ASSERT_EQ(cfg.manifest_file, std::string("MANIFEST"));
    ASSERT_TRUE(cfg.log_file == fs::path("theme.log"));
    ASSERT_TRUE(cfg.validate_on_load);
    ASSERT_TRUE(cfg.mode == hue::ui::ThemeMode::Dark);
}

TEST_CASE(test_derived_paths) {
    Config cfg;
    ASSERT_TRUE(ConfigLoader::manifest_path(cfg) == fs::path("themes.d") / "MANIFEST");
    ASSERT_TRUE(ConfigLoader::default_theme_path(cfg) == fs::path("themes.d") / "monokai");
}

TEST_CASE(test_load_from_file) {
    auto path = write_config("hue_config_full.config",
        "# hue\n"
        "[themes]\n"
        "default_theme = \"dracula\"\n"
        "themes_dir = /opt/hue/themes\n"
        "manifest_file = SHA256SUMS\n"
        "validate_on_load = false\n"
        "\n"
        "[logging]\n"
        "log_file = \"/tmp/hue.log\"\n"
        "\n"
        "[render]\n"
        "mode = light\n");
    auto cfg = ConfigLoader::load_from_file(path);
    fs::remove(path);

    ASSERT_EQ(cfg.default_theme, std::string("dracula"));
    ASSERT_TRUE(cfg.themes_dir == fs::path("/opt/hue/themes"));
    ASSERT_EQ(cfg.manifest_file, std::string("SHA256SUMS"));
    ASSERT_FALSE(cfg.validate_on_load);
    ASSERT_TRUE(cfg.log_file == fs::path("/tmp/hue.log"));
    ASSERT_TRUE(cfg.mode == hue::ui::ThemeMode::Light);
}

TEST_CASE(test_bad_values_keep_defaults) {
    auto path = write_config("hue_config_bad.config",
        "[themes]\n"
        "validate_on_load = maybe\n"
        "unknown_key = 1\n"
        "garbage line\n"
        "[render]\n"
        "mode = solarized\n");
    auto cfg = ConfigLoader::load_from_file(path);
    fs::remove(path);

    ASSERT_TRUE(cfg.validate_on_load);
    ASSERT_TRUE(cfg.mode == hue::ui::ThemeMode::Dark);
}

TEST_CASE(test_keys_outside_their_section_ignored) {
    auto path = write_config("hue_config_section.config", "default_theme = nord\n[logging]\ndefault_theme = nord\n");
    auto cfg = ConfigLoader::load_from_file(path);
    fs::remove(path);

    ASSERT_EQ(cfg.default_theme, std::string("monokai"));
}

TEST_CASE(test_missing_file_gives_defaults) {
    auto cfg = ConfigLoader::load_from_file("/nonexistent/hue/hue.config");
    ASSERT_EQ(cfg.default_theme, std::string("monokai"));
}

TEST_CASE(test_save_then_load) {
    Config cfg;
    cfg.default_theme = "gruvbox";
    cfg.themes_dir = "/srv/themes";
    cfg.validate_on_load = false;
    cfg.mode = hue::ui::ThemeMode::Light;

    auto path = fs::temp_directory_path() / "hue_config_saved" / "hue.config";
    ASSERT_TRUE(ConfigLoader::save_config(cfg, path));
    auto loaded = ConfigLoader::load_from_file(path);
    fs::remove_all(path.parent_path());

    ASSERT_EQ(loaded.default_theme, std::string("gruvbox"));
    ASSERT_TRUE(loaded.themes_dir == fs::path("/srv/themes"));
    ASSERT_FALSE(loaded.validate_on_load);
    ASSERT_TRUE(loaded.mode == hue::ui::ThemeMode::Light);
    ASSERT_EQ(loaded.manifest_file, std::string("MANIFEST"));
}

int main() {
    hue::util::Logger::init("/tmp/hue_test_config.log");
    return hue::test::TestRunner::instance().run_all();
}
