#include "fits_inspect/config/configuration.hpp"
#include "fits_inspect/core/errors.hpp"
#include "fits_inspect/core/types.hpp"
#include "fits_inspect/core/utils.hpp"
#include "fits_inspect/io/result_json.hpp"
#include "fits_inspect/pipeline/classifier.hpp"
#include "fits_inspect/pipeline/extractor.hpp"
#include "fits_inspect/pipeline/pipeline.hpp"
#include "fits_inspect/render/renderer.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace fits_inspect;

static const char* const kRunUsage =
    "Usage: fits_inspect_cli run <fits_path> <previews_dir> [file_name] "
    "[--config P] [--file-id ID]";

static void print_json(const json& j) {
    std::cout << dump_document(j) << std::endl;
}

static json error_document(const std::string& file_name, const std::string& message) {
    PipelineResult r = usage_error(message);
    r.file_name = file_name;
    return r;
}

static std::optional<config::Config> load_config(const std::string& path, const std::string& file_name) {
    if (path.empty()) return config::Config{};
    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        return cfg;
    } catch (const FitsInspectError& e) {
        print_json(error_document(file_name, e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_run(const std::string& fits_path, const std::string& previews_dir,
                   const std::string& file_name, const std::string& config_path,
                   const std::string& file_id) {
    const std::string display = file_name.empty() ? fs::path(fits_path).filename().string() : file_name;
    auto cfg = load_config(config_path, display);
    if (!cfg) return 0;

    pipeline::RunOptions options;
    options.config = *cfg;
    if (!file_id.empty()) options.file_id = file_id;
    options.log = &std::cerr;

    std::optional<std::string> name;
    if (!file_name.empty()) name = file_name;
    print_json(pipeline::run(fits_path, previews_dir, name, options));
    return 0;
}

static int cmd_summary(const std::string& fits_path, const std::string& config_path) {
    const std::string name = fs::path(fits_path).filename().string();
    auto cfg = load_config(config_path, name);
    if (!cfg) return 0;

    auto summaries = pipeline::extract(fits_path, cfg->classify);
    if (!summaries) {
        print_json(error_document(name, summaries.failure().message));
        return 0;
    }
    print_json(json{{"status", "success"}, {"fileName", name}, {"hdus", summaries.value()}});
    return 0;
}

static int cmd_analyze(const std::string& fits_path, const std::string& config_path) {
    const std::string name = fs::path(fits_path).filename().string();
    auto cfg = load_config(config_path, name);
    if (!cfg) return 0;

    auto summaries = pipeline::extract(fits_path, cfg->classify);
    if (!summaries) {
        print_json(error_document(name, summaries.failure().message));
        return 0;
    }
    const std::vector<Analysis> analyses =
        pipeline::classify(fits_path, summaries.value(), cfg->classify);
    print_json(json{{"status", "success"}, {"fileName", name}, {"hdus", analyses}});
    return 0;
}

static int cmd_render(const std::string& fits_path, const std::string& previews_dir,
                      const std::string& config_path, const std::string& file_id) {
    const std::string name = fs::path(fits_path).filename().string();
    auto cfg = load_config(config_path, name);
    if (!cfg) return 0;

    auto summaries = pipeline::extract(fits_path, cfg->classify);
    if (!summaries) {
        print_json(error_document(name, summaries.failure().message));
        return 0;
    }
    const std::vector<Analysis> analyses =
        pipeline::classify(fits_path, summaries.value(), cfg->classify);
    try {
        const std::string fid = file_id.empty() ? core::random_hex_id(8) : file_id;
        const auto urls = render::render_all(fits_path, analyses, previews_dir, fid, *cfg);
        json previews = json::array();
        for (const auto& u : urls) {
            previews.push_back(u ? json(*u) : json(nullptr));
        }
        print_json(json{{"status", "success"}, {"fileName", name}, {"fileId", fid},
                        {"previews", previews}});
    } catch (const RenderError& e) {
        print_json(error_document(name, e.what()));
    }
    return 0;
}

static int cmd_default_config() {
    YAML::Emitter out;
    out << config::Config{}.to_yaml();
    std::cout << out.c_str() << std::endl;
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cerr << "Usage: fits_inspect_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  run <fits_path> <previews_dir> [file_name] [--config P] [--file-id ID]\n"
              << "                                  Extract, classify and render one file\n"
              << "  summary <fits_path> [--config P]  Print per-HDU structural summaries\n"
              << "  analyze <fits_path> [--config P]  Print per-HDU classifications\n"
              << "  render <fits_path> <previews_dir> [--config P] [--file-id ID]\n"
              << "                                  Write previews and list their URLs\n"
              << "  default-config                  Print the default YAML configuration\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "run") {
        std::string fits_path = get_positional(0);
        std::string previews_dir = get_positional(1);
        if (fits_path.empty() || previews_dir.empty()) {
            print_json(usage_error(kRunUsage));
            return 0;
        }
        return cmd_run(fits_path, previews_dir, get_positional(2), get_arg("--config"),
                       get_arg("--file-id"));
    }

    if (command == "summary") {
        std::string fits_path = get_positional(0);
        if (fits_path.empty()) {
            print_json(usage_error("Usage: fits_inspect_cli summary <fits_path> [--config P]"));
            return 0;
        }
        return cmd_summary(fits_path, get_arg("--config"));
    }

    if (command == "analyze") {
        std::string fits_path = get_positional(0);
        if (fits_path.empty()) {
            print_json(usage_error("Usage: fits_inspect_cli analyze <fits_path> [--config P]"));
            return 0;
        }
        return cmd_analyze(fits_path, get_arg("--config"));
    }

    if (command == "render") {
        std::string fits_path = get_positional(0);
        std::string previews_dir = get_positional(1);
        if (fits_path.empty() || previews_dir.empty()) {
            print_json(usage_error("Usage: fits_inspect_cli render <fits_path> <previews_dir> "
                                   "[--config P] [--file-id ID]"));
            return 0;
        }
        return cmd_render(fits_path, previews_dir, get_arg("--config"), get_arg("--file-id"));
    }

    if (command == "default-config") {
        return cmd_default_config();
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
