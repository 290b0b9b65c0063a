// =============================================================================
// geotime - 128-bit Millisecond Timestamps
// =============================================================================
// Main entry point for the geotime command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: encode, decode, display, codecs
// - Global options: verbose, quiet, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "geotime/codec/lexical_codec.h"
#include "geotime/common/error.h"
#include "geotime/common/logger.h"
#include "geotime/display/display_pipeline.h"
#include "geotime/display/magnitude_formatter.h"

#include "commands/decode_command.h"
#include "commands/display_command.h"
#include "commands/encode_command.h"

namespace geotime::commands {
int runEncode(CLI::App* app);
int runDecode(CLI::App* app);
int runDisplay(CLI::App* app);
int runCodecs(CLI::App* app);
}  // namespace geotime::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "geotime: signed 128-bit millisecond timestamps\n"
    "Order-preserving lexical encodings and tiered human-readable display.\n\n"
    "Values are milliseconds relative to 1970-01-01T00:00:00Z; negative values\n"
    "are before the epoch.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = warnings, 1 = info, 2 = debug
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

/// @brief Codec names accepted by --codec.
const std::vector<std::string> kCodecNames = {"hex", "base32hex", "geohash", "base64"};

// =============================================================================
// Encode Command Options
// =============================================================================

struct CliEncodeOptions {
    std::vector<std::string> values;
    std::string codec = "hex";
    bool all = false;
};

CliEncodeOptions gEncodeOpts;

// =============================================================================
// Decode Command Options
// =============================================================================

struct CliDecodeOptions {
    std::vector<std::string> inputs;
    std::string codec = "hex";
    bool display = false;
    std::string pattern{geotime::display::kDefaultPattern};
};

CliDecodeOptions gDecodeOpts;

// =============================================================================
// Display Command Options
// =============================================================================

struct CliDisplayOptions {
    std::vector<std::string> values;
    std::string pattern{geotime::display::kDefaultPattern};
    bool showTier = false;
    int decimals = geotime::display::kDefaultMagnitudeDecimals;
};

CliDisplayOptions gDisplayOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupEncodeCommand(CLI::App& app) {
    auto* encode = app.add_subcommand("encode", "Encode millisecond offsets as sortable strings");
    encode->alias("e");

    encode->add_option("values", gEncodeOpts.values, "Millisecond offsets (decimal, signed)")
        ->required();

    encode->add_option("-c,--codec", gEncodeOpts.codec, "Codec: hex, base32hex, geohash, base64")
        ->default_val("hex")
        ->check(CLI::IsMember(kCodecNames, CLI::ignore_case));

    encode->add_flag("-a,--all", gEncodeOpts.all, "Print the encoding in every codec");
}

void setupDecodeCommand(CLI::App& app) {
    auto* decode = app.add_subcommand("decode", "Decode sortable strings to millisecond offsets");
    decode->alias("d");

    decode->add_option("inputs", gDecodeOpts.inputs, "Encoded strings")->required();

    decode->add_option("-c,--codec", gDecodeOpts.codec, "Codec: hex, base32hex, geohash, base64")
        ->default_val("hex")
        ->check(CLI::IsMember(kCodecNames, CLI::ignore_case));

    decode->add_flag("--display", gDecodeOpts.display, "Also print the display rendering");

    decode->add_option("-f,--format", gDecodeOpts.pattern, "Calendar pattern for --display")
        ->default_val(std::string{geotime::display::kDefaultPattern});
}

void setupDisplayCommand(CLI::App& app) {
    auto* display = app.add_subcommand("display", "Render millisecond offsets for humans");
    display->alias("show");

    display->add_option("values", gDisplayOpts.values, "Millisecond offsets (decimal, signed)")
        ->required();

    display->add_option("-f,--format", gDisplayOpts.pattern,
                        "Calendar pattern (chrono specifiers, e.g. %Y-%m-%d)")
        ->default_val(std::string{geotime::display::kDefaultPattern});

    display->add_flag("--tier", gDisplayOpts.showTier, "Prefix output with the tier used");

    display->add_option("--decimals", gDisplayOpts.decimals,
                        "Decimal places for magnitude renderings")
        ->default_val(geotime::display::kDefaultMagnitudeDecimals)
        ->check(CLI::Range(0, geotime::display::kMaxMagnitudeDecimals));
}

void setupCodecsCommand(CLI::App& app) {
    app.add_subcommand("codecs", "List available codecs");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for debug)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");
    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupEncodeCommand(app);
    setupDecodeCommand(app);
    setupDisplayCommand(app);
    setupCodecsCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        auto logLevel = geotime::log::Level::kWarning;
        if (gOptions.quiet) {
            logLevel = geotime::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = geotime::log::Level::kDebug;
        } else if (gOptions.verbosity >= 1) {
            logLevel = geotime::log::Level::kInfo;
        }
        geotime::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("encode")) {
            exitCode = geotime::commands::runEncode(app.get_subcommand("encode"));
        } else if (app.got_subcommand("decode")) {
            exitCode = geotime::commands::runDecode(app.get_subcommand("decode"));
        } else if (app.got_subcommand("display")) {
            exitCode = geotime::commands::runDisplay(app.get_subcommand("display"));
        } else if (app.got_subcommand("codecs")) {
            exitCode = geotime::commands::runCodecs(app.get_subcommand("codecs"));
        }
    } catch (const geotime::GeotimeException& ex) {
        GEOTIME_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        GEOTIME_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    geotime::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace geotime::commands {

int runEncode([[maybe_unused]] CLI::App* app) {
    EncodeOptions opts;
    opts.values = gEncodeOpts.values;
    opts.codec = unwrapOrThrow(codec::parseCodecKind(gEncodeOpts.codec));
    opts.allCodecs = gEncodeOpts.all;

    EncodeCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runDecode([[maybe_unused]] CLI::App* app) {
    DecodeOptions opts;
    opts.inputs = gDecodeOpts.inputs;
    opts.codec = unwrapOrThrow(codec::parseCodecKind(gDecodeOpts.codec));
    opts.showDisplay = gDecodeOpts.display;
    opts.pattern = gDecodeOpts.pattern;

    DecodeCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runDisplay([[maybe_unused]] CLI::App* app) {
    DisplayOptions opts;
    opts.values = gDisplayOpts.values;
    opts.pattern = gDisplayOpts.pattern;
    opts.showTier = gDisplayOpts.showTier;
    opts.magnitude.decimals = gDisplayOpts.decimals;

    DisplayCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runCodecs([[maybe_unused]] CLI::App* app) {
    for (codec::CodecKind kind : codec::kAllCodecKinds) {
        const auto& lexical = codec::codecFor(kind);
        std::cout << lexical.name() << "\tradix=" << lexical.alphabet().radix()
                  << "\twidth=" << lexical.width() << "\t" << lexical.alphabet().symbols()
                  << '\n';
    }
    return EXIT_SUCCESS;
}

}  // namespace geotime::commands
