#include "../framework/SimpleTest.hpp"
#include "config/Theme.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>

using namespace hue::config;

TEST_CASE(test_load_attributes_in_order) {
    auto theme = ThemeLoader::load_from_string("test", "fg = #e0e0e0\nbg = #1e1e1e\naccent = hsl(200,80%,60%)\n");
    ASSERT_TRUE(theme.has_value());
    const auto& attrs = theme->list_attributes();
    ASSERT_EQ(attrs.size(), 3u);
    ASSERT_EQ(attrs[0].first, std::string("fg"));
    ASSERT_EQ(attrs[0].second, std::string("#e0e0e0"));
    ASSERT_EQ(attrs[2].first, std::string("accent"));
    ASSERT_EQ(attrs[2].second, std::string("hsl(200,80%,60%)"));
}

TEST_CASE(test_comments_blank_lines_and_quotes) {
    auto theme = ThemeLoader::load_from_string("test",
        "# header comment\n"
        "\n"
        "; another comment\n"
        "  name   =   \"Monokai Pro\"  \n");
    ASSERT_TRUE(theme.has_value());
    ASSERT_EQ(theme->size(), 1u);
    ASSERT_EQ(*theme->get("name"), std::string("Monokai Pro"));
}

TEST_CASE(test_sections_prefix_keys) {
    auto theme = ThemeLoader::load_from_string("test", "fg = #fff\n[status]\nwarning = #ffcb00\n[ error ]\nfg = #f00\n");
    ASSERT_TRUE(theme.has_value());
    ASSERT_EQ(*theme->get("status.warning"), std::string("#ffcb00"));
    ASSERT_EQ(*theme->get("error.fg"), std::string("#f00"));
    ASSERT_EQ(*theme->get("fg"), std::string("#fff"));
}

TEST_CASE(test_duplicates_kept_last_wins) {
    auto theme = ThemeLoader::load_from_string("test", "fg = #111\nfg = #222\n");
    ASSERT_TRUE(theme.has_value());
    ASSERT_EQ(theme->size(), 2u);
    ASSERT_EQ(*theme->get("fg"), std::string("#222"));
    ASSERT_FALSE(theme->get("bg").has_value());
}

TEST_CASE(test_empty_value_allowed) {
    auto theme = ThemeLoader::load_from_string("test", "bg =\n");
    ASSERT_TRUE(theme.has_value());
    ASSERT_EQ(*theme->get("bg"), std::string(""));
}

TEST_CASE(test_malformed_line_is_load_error) {
    ASSERT_FALSE(ThemeLoader::load_from_string("test", "fg = #fff\njust some words\n").has_value());
    ASSERT_FALSE(ThemeLoader::load_from_string("test", "= #fff\n").has_value());
}

TEST_CASE(test_empty_theme) {
    auto theme = ThemeLoader::load_from_string("empty", "");
    ASSERT_TRUE(theme.has_value());
    ASSERT_TRUE(theme->empty());
}

TEST_CASE(test_load_from_file) {
    auto path = std::filesystem::temp_directory_path() / "hue_loader_test.theme";
    {
        std::ofstream f(path);
        f << "fg = #e0e0e0\r\nbg = #1e1e1e\r\n";
    }
    auto theme = ThemeLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(theme.has_value());
    ASSERT_EQ(theme->name(), std::string("hue_loader_test.theme"));
    ASSERT_TRUE(theme->path() == path);
    ASSERT_EQ(*theme->get("bg"), std::string("#1e1e1e"));
}

TEST_CASE(test_load_missing_file) {
    ASSERT_FALSE(ThemeLoader::load_from_file("/nonexistent/hue/dark.theme").has_value());
}

TEST_CASE(test_load_symlink_loop_fails) {
    auto path = std::filesystem::temp_directory_path() / "hue_loader_loop.theme";
    std::filesystem::remove(path);
    std::filesystem::create_symlink(path, path);
    bool loaded = true;
    try {
        loaded = ThemeLoader::load_from_file(path).has_value();
    } catch (const std::filesystem::filesystem_error& e) {
        std::filesystem::remove(path);
        throw hue::test::AssertionFailure(std::string("load_from_file threw: ") + e.what());
    }
    std::filesystem::remove(path);
    ASSERT_FALSE(loaded);
}

TEST_CASE(test_load_directory_fails) {
    ASSERT_FALSE(ThemeLoader::load_from_file(std::filesystem::temp_directory_path()).has_value());
}

int main() {
    hue::util::Logger::init("/tmp/hue_test_theme_loader.log");
    return hue::test::TestRunner::instance().run_all();
}
