#include "backend/Config.hpp"
#include "backend/ThemeManager.hpp"
#include "integrity/ManifestVerifier.hpp"
#include "util/Logger.hpp"
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct Options {
    std::optional<std::string> theme;
    std::optional<std::string> hash_file;
    bool load = false;
    bool validate = false;
    bool preview = false;
    bool help = false;
};

constexpr const char* kUsage =
    "Usage: hue [-t FILE] [-v | -l] [-p] [--hash FILE] [-h]\n"
    "Manage and validate themes for hue.\n"
    "\n"
    "  -t, --theme FILE   Theme file to load or validate\n"
    "  -v, --validate     Validate the theme against its MANIFEST hash\n"
    "  -l, --load         Load the theme and list its attributes\n"
    "  -p, --preview      Render color attributes as swatches\n"
    "      --hash FILE    Print the MANIFEST line for FILE\n"
    "  -h, --help         Show this help\n";

// Returns std::nullopt on a usage error (already reported)
std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto needs_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "hue: option " << flag << " requires an argument\n" << kUsage;
                return nullptr;
            }
            return argv[++i];
        };

        if (!std::strcmp(arg, "-t") || !std::strcmp(arg, "--theme")) {
            const char* value = needs_value(arg);
            if (!value) return std::nullopt;
            opts.theme = value;
        } else if (!std::strcmp(arg, "--hash")) {
            const char* value = needs_value(arg);
            if (!value) return std::nullopt;
            opts.hash_file = value;
        } else if (!std::strcmp(arg, "-v") || !std::strcmp(arg, "--validate")) {
            opts.validate = true;
        } else if (!std::strcmp(arg, "-l") || !std::strcmp(arg, "--load")) {
            opts.load = true;
        } else if (!std::strcmp(arg, "-p") || !std::strcmp(arg, "--preview")) {
            opts.preview = true;
        } else if (!std::strcmp(arg, "-h") || !std::strcmp(arg, "--help")) {
            opts.help = true;
        } else {
            std::cerr << "hue: unknown option '" << arg << "'\n" << kUsage;
            return std::nullopt;
        }
    }
    return opts;
}

void print_theme(const hue::backend::ThemeManager& manager, const hue::config::Theme& theme,
                 const char* label, bool preview) {
    std::cout << label << hue::backend::ThemeManager::describe(theme) << "\n";
    if (preview) {
        for (const auto& line : manager.preview_lines(theme)) {
            std::cout << line << "\n";
        }
    }
}

int run_with_theme(const hue::backend::ThemeManager& manager, const Options& opts) {
    using hue::util::Logger;
    const std::string& theme_file = *opts.theme;

    if (opts.validate) {
        if (!manager.validate_theme(theme_file)) {
            Logger::error("Failed to validate theme: " + theme_file);
            std::cerr << "Failed to validate theme: " << theme_file << "\n";
            return 1;
        }
        Logger::info("Theme validated: " + theme_file);
        std::cout << "Theme validated: " << theme_file << "\n";
        return 0;
    }

    if (opts.load) {
        auto theme = manager.get_theme_instance(theme_file);
        if (!theme) {
            std::cerr << "Failed to load theme: " << theme_file << "\n";
            return 1;
        }
        print_theme(manager, *theme, "Loaded theme: ", opts.preview);
        Logger::info("Loaded theme: " + theme_file);
        return 0;
    }

    std::cout << "No action specified. Use -l/--load or -v/--validate with -t/--theme.\n";
    return 0;
}

int run_default(const hue::backend::ThemeManager& manager, const Options& opts) {
    auto theme = manager.open_default_theme();
    if (!theme) {
        std::cerr << "Failed to load default theme: "
                  << hue::backend::ConfigLoader::default_theme_path(manager.config()).string() << "\n";
        return 1;
    }
    print_theme(manager, *theme, "Theme loaded: ", opts.preview);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        return 2;
    }
    if (opts->help) {
        std::cout << kUsage;
        return 0;
    }

    try {
        auto config = hue::backend::ConfigLoader::load_config();
        hue::util::Logger::init(config.log_file);
        hue::util::Logger::info("hue starting...");

        if (opts->hash_file) {
            auto line = hue::integrity::ManifestVerifier::manifest_line(*opts->hash_file);
            if (!line) {
                std::cerr << "Cannot read " << *opts->hash_file << "\n";
                return 1;
            }
            std::cout << *line << "\n";
            return 0;
        }

        hue::backend::ThemeManager manager(config);
        if (opts->theme) {
            return run_with_theme(manager, *opts);
        }
        return run_default(manager, *opts);

    } catch (const hue::integrity::ManifestParseError& e) {
        hue::util::Logger::error(std::string("Malformed MANIFEST: ") + e.what());
        std::cerr << "hue: malformed MANIFEST: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        hue::util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "hue: " << e.what() << "\n";
        return 1;
    }
}
