#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <cxxopts.hpp>

#include "../include/swiss_army_archive.hpp"
#include "./path/path_utils.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define APP_VERSION XSTRING(CMAKE_PROJECT_VERSION)

static void print_usage(const cxxopts::Options &options) {
    fprintf(stderr, "%s", options.help().c_str());
}

static int compress(
    const std::string &input,
    const std::string &output,
    const std::optional<std::vector<std::string>> &includes,
    const std::optional<std::vector<std::string>> &excludes,
    ConsoleStatusSink *sink) {
    const auto output_path = std::filesystem::path(output);

    const auto manifest_ret = build_manifest(input, includes, excludes);
    if (std::holds_alternative<archive_error_t>(manifest_ret)) {
        fprintf(stderr, "Could not collect files: %s\n", error_to_string(std::get<archive_error_t>(manifest_ret)).c_str());
        return EXIT_FAILURE;
    }
    const auto &entries = std::get<std::vector<entry_t>>(manifest_ret);
    fprintf(stdout, "Archiving %zu files from \"%s\" to \"%s\"\n", entries.size(), input.c_str(), output.c_str());

    auto encoder_ret = Encoder::create(output_path.parent_path(), output_path.filename().string());
    if (std::holds_alternative<archive_error_t>(encoder_ret)) {
        fprintf(stderr, "Could not create archive: %s\n", error_to_string(std::get<archive_error_t>(encoder_ret)).c_str());
        return EXIT_FAILURE;
    }
    auto encoder = std::move(std::get<Encoder>(encoder_ret));

    const auto add_error = encoder.add_entries(entries, sink);
    if (add_error.has_value()) {
        fprintf(stderr, "Could not add files: %s\n", error_to_string(add_error.value()).c_str());
        return EXIT_FAILURE;
    }

    const auto encoded_ret = std::move(encoder).compress(sink);
    if (std::holds_alternative<archive_error_t>(encoded_ret)) {
        fprintf(stderr, "Could not compress archive: %s\n", error_to_string(std::get<archive_error_t>(encoded_ret)).c_str());
        return EXIT_FAILURE;
    }
    const auto &encoded = std::get<EncodedArchive>(encoded_ret);

    const auto digest_ret = encoded.digest(sink);
    if (std::holds_alternative<archive_error_t>(digest_ret)) {
        fprintf(stderr, "Could not compute digest: %s\n", error_to_string(std::get<archive_error_t>(digest_ret)).c_str());
        return EXIT_FAILURE;
    }
    if (sink != nullptr) {
        sink->finish();
    }
    fprintf(stdout, "%s  %s\n", std::get<std::string>(digest_ret).c_str(), encoded.get_path().string().c_str());
    return EXIT_SUCCESS;
}

static int extract(
    const std::string &input,
    const std::string &output,
    const std::optional<std::string> &sha256,
    ConsoleStatusSink *sink) {
    fprintf(stdout, "Extracting \"%s\" to \"%s\"\n", input.c_str(), output.c_str());

    auto decoder_ret = Decoder::create(input, sha256, output);
    if (std::holds_alternative<archive_error_t>(decoder_ret)) {
        fprintf(stderr, "Could not open archive: %s\n", error_to_string(std::get<archive_error_t>(decoder_ret)).c_str());
        return EXIT_FAILURE;
    }
    auto decoder = std::move(std::get<Decoder>(decoder_ret));

    const auto extracted_ret = std::move(decoder).extract(sink);
    if (std::holds_alternative<archive_error_t>(extracted_ret)) {
        fprintf(stderr, "Could not extract archive: %s\n", error_to_string(std::get<archive_error_t>(extracted_ret)).c_str());
        return EXIT_FAILURE;
    }
    if (sink != nullptr) {
        sink->finish();
    }
    fprintf(stdout, "Extracted %zu files\n", std::get<extracted_t>(extracted_ret).files.size());
    return EXIT_SUCCESS;
}

int main(int argc, char const* argv[]) {
    cxxopts::Options options(APP_NAME);

    options.add_options()
           ("c,compress", "File or directory to archive", cxxopts::value<std::string>())
           ("x,extract", "Archive to extract (.tar.gz, .tgz, .tar.bz2, .tar.bz, .tar.xz, .tar.7z, .zip)", cxxopts::value<std::string>())
           ("o,output", "Archive file to create, or directory to extract to. Default directory for extraction is the archive name without suffix", cxxopts::value<std::string>())
           ("include", "Only archive paths matching this glob (repeatable)", cxxopts::value<std::vector<std::string>>())
           ("exclude", "Do not archive paths matching this glob (repeatable)", cxxopts::value<std::vector<std::string>>())
           ("s,sha256", "Expected SHA-256 of the archive to extract", cxxopts::value<std::string>())
           ("q,quiet", "Do not show progress")
           ("v,version", "Show version")
           ("h,help", "Show help");

    cxxopts::ParseResult args;

    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &x) {
        fprintf(stderr, "%s: %s\n", APP_NAME, x.what());
        print_usage(options);
        return EXIT_FAILURE;
    }

    if (args.count("help")) {
        print_usage(options);
        return EXIT_SUCCESS;
    }

    if (args.count("version")) {
        fprintf(stderr, "%s: %s\n", APP_NAME, APP_VERSION);
        return EXIT_SUCCESS;
    }

    const auto do_compress = args.count("compress") > 0;
    const auto do_extract = args.count("extract") > 0;
    if (do_compress == do_extract) {
        fprintf(stderr, "Exactly one of --compress and --extract must be set.\n");
        print_usage(options);
        return EXIT_FAILURE;
    }

    std::unique_ptr<ConsoleStatusSink> console_sink;
    if (!args.count("quiet")) {
        console_sink = std::make_unique<ConsoleStatusSink>(stderr);
    }

    if (do_compress) {
        if (!args.count("output")) {
            fprintf(stderr, "Output archive is not set.\n");
            print_usage(options);
            return EXIT_FAILURE;
        }
        const auto output = args["output"].as<std::string>();
        if (!driver_from_filename(std::filesystem::path(output).filename().string()).has_value()) {
            fprintf(stderr, "Unsupported archive suffix \"%s\".\n", output.c_str());
            return EXIT_FAILURE;
        }
        std::optional<std::vector<std::string>> includes;
        if (args.count("include")) {
            includes = args["include"].as<std::vector<std::string>>();
        }
        std::optional<std::vector<std::string>> excludes;
        if (args.count("exclude")) {
            excludes = args["exclude"].as<std::vector<std::string>>();
        }
        return compress(args["compress"].as<std::string>(), output, includes, excludes, console_sink.get());
    }

    const auto input = args["extract"].as<std::string>();
    auto output = folder_for_unpacked_file(input).string();
    if (args.count("output")) {
        output = args["output"].as<std::string>();
    }
    std::optional<std::string> sha256;
    if (args.count("sha256")) {
        sha256 = args["sha256"].as<std::string>();
    }
    return extract(input, output, sha256, console_sink.get());
}
