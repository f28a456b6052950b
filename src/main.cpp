/**
 * MatBridge - Entry Point
 *
 *   matbridge --package <file.unitypackage> --material-list <MaterialList.txt> --output <dir>
 *   matbridge --list <file.unitypackage>
 *   matbridge --help
 */

#include "matbridge/pipeline.hpp"
#include "matbridge/package_extractor.hpp"
#include "matbridge/material_parser.hpp"
#include "matbridge/shader_classifier.hpp"
#include "matbridge/settings.hpp"
#include "matbridge/logging.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool list_mode = false;
    std::string package_path;
    std::vector<std::string> material_lists;
    std::string output_dir;
    std::string config_path;
    std::string shader_base;
    std::string texture_base;
    bool verbose = false;
    bool debug_logging = false;
};

void print_help() {
    std::cout << R"(
MatBridge - Unity package to Godot material converter

Usage:
  matbridge --help                                  Show this help
  matbridge --list <package>                        List materials and their shader families
  matbridge --package <package> --output <dir> [options]

Options:
  --help, -h                 Show this help message
  --list, -l <package>       Classify the package's materials without writing files
  --package, -p <package>    .unitypackage to convert
  --material-list, -m <txt>  MaterialList.txt manifest (repeatable)
  --output, -o <dir>         Output directory (materials/ and the mesh mapping JSON)
  --config, -c <json>        Settings file
  --shader-base <path>       Godot path of the .gdshader files (default res://shaders)
  --texture-base <path>      Godot path of the copied textures (default res://textures)
  --verbose, -v              Print every diagnostic
  --debug, -d                Enable debug logging

Examples:
  matbridge -p POLYGON_NatureBiomes.unitypackage -m SourceFiles/MaterialList.txt -o ./godot
  matbridge --list POLYGON_Fantasy.unitypackage
  matbridge --debug -p Pack.unitypackage -o ./out -c matbridge.json

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--list" || arg == "-l") {
            args.list_mode = true;
            if (i + 1 < argc) {
                args.package_path = argv[++i];
            }
        }
        else if (arg == "--package" || arg == "-p") {
            if (i + 1 < argc) {
                args.package_path = argv[++i];
            }
        }
        else if (arg == "--material-list" || arg == "-m") {
            if (i + 1 < argc) {
                args.material_lists.push_back(argv[++i]);
            }
        }
        else if (arg == "--output" || arg == "-o") {
            if (i + 1 < argc) {
                args.output_dir = argv[++i];
            }
        }
        else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            }
        }
        else if (arg == "--shader-base") {
            if (i + 1 < argc) {
                args.shader_base = argv[++i];
            }
        }
        else if (arg == "--texture-base") {
            if (i + 1 < argc) {
                args.texture_base = argv[++i];
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else {
            std::cerr << "Warning: Ignoring unknown argument: " << arg << "\n";
        }
    }

    return args;
}

int run_list(const CliArgs& args, const matbridge::Settings& settings) {
    matbridge::ExtractOptions options;
    options.content_size_limit = settings.content_size_limit;
    options.temp_prefix = settings.temp_prefix;
    options.temp_root = settings.temp_root;

    auto index = matbridge::extract_package(std::filesystem::path(args.package_path), options);
    if (!index) {
        std::cerr << "Error: " << index.error().full_message() << "\n";
        return 1;
    }

    std::cout << "Package: " << args.package_path << "\n";
    for (const auto& [ext, count] : index->extension_summary()) {
        std::cout << "  " << (ext.empty() ? "(none)" : ext) << ": " << count << "\n";
    }
    std::cout << "\n";

    auto batch = matbridge::parse_package_materials(index.value());
    for (const auto& record : batch.records) {
        auto decision = matbridge::classify(record);
        std::cout << record.name << " -> " << matbridge::family_shader_file(decision.family)
                  << " (" << matbridge::basis_name(decision.basis) << ")\n";
    }
    for (const auto& diagnostic : batch.diagnostics) {
        std::cout << diagnostic.to_string() << "\n";
    }

    std::cout << "\nMaterials: " << batch.records.size() << "\n";
    return 0;
}

int run_convert(const CliArgs& args, const matbridge::Settings& settings) {
    if (args.output_dir.empty()) {
        std::cerr << "Error: No output directory specified (use --output)\n";
        return 1;
    }

    matbridge::ConversionInputs inputs;
    inputs.package = args.package_path;
    for (const auto& list : args.material_lists) {
        inputs.material_lists.emplace_back(list);
    }

    auto report = matbridge::convert_package(inputs, settings);
    if (!report) {
        std::cerr << "Error: " << report.error().full_message() << "\n";
        return 1;
    }

    auto written = matbridge::write_report_outputs(report.value(), args.output_dir, settings);
    if (!written) {
        std::cerr << "Error: " << written.error().full_message() << "\n";
        return 1;
    }

    using matbridge::DiagnosticKind;
    const auto& diagnostics = report->diagnostics;
    if (args.verbose) {
        for (const auto& diagnostic : diagnostics) {
            std::cout << diagnostic.to_string() << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Materials parsed:    " << report->materials_parsed << "\n";
    std::cout << "Materials written:   " << report->materials.size() << "\n";
    std::cout << "Placeholders:        " << report->placeholders << "\n";
    std::cout << "Texture bindings:    " << report->required_textures.size() << "\n";
    std::cout << "Parse failures:      "
              << matbridge::count_diagnostics(diagnostics, DiagnosticKind::MaterialParseError) << "\n";
    std::cout << "Mapping failures:    "
              << matbridge::count_diagnostics(diagnostics, DiagnosticKind::MappingError) << "\n";
    std::cout << "Unresolved refs:     "
              << matbridge::count_diagnostics(diagnostics, DiagnosticKind::UnresolvedReference) << "\n";
    std::cout << "Generic fallbacks:   "
              << matbridge::count_diagnostics(diagnostics, DiagnosticKind::ClassificationFallback) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.package_path.empty()) {
        std::cerr << "Error: No package specified\n";
        print_help();
        return 1;
    }

    if (!std::filesystem::exists(args.package_path)) {
        std::cerr << "Error: Package not found: " << args.package_path << "\n";
        return 1;
    }

    matbridge::Settings settings;
    if (!args.config_path.empty()) {
        auto loaded = matbridge::load_settings(args.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().full_message() << "\n";
            return 1;
        }
        settings = loaded.value();
    }
    if (!args.shader_base.empty()) settings.shader_base = args.shader_base;
    if (!args.texture_base.empty()) settings.texture_base = args.texture_base;

    auto& logger = matbridge::Logger::instance();
    logger.set_level(args.debug_logging ? matbridge::LogLevel::Debug : settings.log_level);
    if (!settings.log_file.empty() && !logger.set_file(settings.log_file)) {
        std::cerr << "Warning: Cannot open log file: " << settings.log_file.string() << "\n";
    }
    if (args.debug_logging) {
        LOG_INFO("App", "Debug logging enabled");
    }

    int result = args.list_mode ? run_list(args, settings) : run_convert(args, settings);

    logger.close_file();
    return result;
}
