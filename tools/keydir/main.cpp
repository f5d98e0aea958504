/**
 * @file main.cpp
 * @brief keydir CLI entry point
 *
 * Commands:
 *   check     - Verify records against the by-fpr/by-keyid/by-email indices
 *   lookup    - Resolve an identifier through its index
 *   import    - Store a certificate descriptor and index it
 *   version   - Show version information
 */

#include "keydir/require_cpp23.hpp"

#include "keydir/common.hpp"
#include "keydir/config.hpp"
#include "keydir/database.hpp"
#include "keydir/descriptor.hpp"
#include "keydir/identifier.hpp"
#include "keydir/logging.hpp"
#include "keydir/version.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

void print_version()
{
    std::println("keydir {} ({})", keydir::kVersion, keydir::kBuildId);
    std::println("  layout: {}", keydir::kLayoutVersion);
}

void print_help()
{
    std::print(R"(keydir - Filesystem storage engine for a public certificate directory

Usage: keydir <command> [options]

Commands:
  check       Verify records against their indices
  lookup      Resolve an identifier through its index
  import      Store a certificate descriptor and index it
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'keydir <command> --help' for command-specific options.
)");
}

void print_store_options()
{
    std::print(R"(
Store Options:
  --config FILE             keydir_config.v1 JSON file
  --base DIR                Use DIR/keys and DIR/tmp (ignored with --config)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --dry-run                 Validate but do not modify the store
  --help, -h                Show this help
)");
}

void print_check_help()
{
    std::print(R"(Usage: keydir check [options]

Verify that every published record is indexed by all of its capable keys
and emails, and that every index entry belongs to the record it names.
)");
    print_store_options();
}

void print_lookup_help()
{
    std::print(R"(Usage: keydir lookup [options]

Options:
  --fingerprint FPR         Look up by (sub)key fingerprint
  --keyid KEYID             Look up by key id
  --email ADDRESS           Look up by email
  --path                    Print the entry path relative to the external root
  --primary                 Print the primary fingerprint instead of the record
)");
    print_store_options();
}

void print_import_help()
{
    std::print(R"(Usage: keydir import [options]

Options:
  --descriptor FILE         cert_descriptor.v1 JSON file (required)
)");
    print_store_options();
}

struct StoreOptions
{
    std::optional<std::string> config;
    std::optional<std::string> base;
    std::string schema_dir;
    bool dry_run;
};

struct CheckOptions
{
    StoreOptions store;
    bool show_help;
};

struct LookupOptions
{
    StoreOptions store;
    std::optional<std::string> fingerprint;
    std::optional<std::string> keyid;
    std::optional<std::string> email;
    bool print_path;
    bool print_primary;
    bool show_help;
};

struct ImportOptions
{
    StoreOptions store;
    std::string descriptor;
    bool show_help;
};

[[nodiscard]] StoreOptions default_store_options()
{
    return StoreOptions{.config = std::nullopt,
                        .base = std::nullopt,
                        .schema_dir = "schemas",
                        .dry_run = false};
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> keydir::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            keydir::make_error(keydir::errc::kMissingArgument,
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_store_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    StoreOptions& options,
                                    bool& skip_next) -> keydir::Result<bool>
{
    if (arg == "--config") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.config = *value;
        skip_next = true;
        return keydir::Result<bool>{true};
    }
    if (arg == "--base") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.base = *value;
        skip_next = true;
        return keydir::Result<bool>{true};
    }
    if (arg == "--schema-dir") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.schema_dir = *value;
        skip_next = true;
        return keydir::Result<bool>{true};
    }
    if (arg == "--dry-run") {
        options.dry_run = true;
        return keydir::Result<bool>{true};
    }
    return keydir::Result<bool>{false};
}

[[nodiscard]] keydir::Result<CheckOptions> parse_check_args(std::span<char*> args)
{
    CheckOptions options{.store = default_store_options(), .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_store_option(arg, args, idx, options.store, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(keydir::make_error(keydir::errc::kInvalidArgument,
                                                      "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] keydir::Result<LookupOptions> parse_lookup_args(std::span<char*> args)
{
    LookupOptions options{.store = default_store_options(),
                          .fingerprint = std::nullopt,
                          .keyid = std::nullopt,
                          .email = std::nullopt,
                          .print_path = false,
                          .print_primary = false,
                          .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--fingerprint" || arg == "--keyid" || arg == "--email") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--fingerprint") {
                options.fingerprint = *value;
            } else if (arg == "--keyid") {
                options.keyid = *value;
            } else {
                options.email = *value;
            }
            skip_next = true;
            continue;
        }
        if (arg == "--path") {
            options.print_path = true;
            continue;
        }
        if (arg == "--primary") {
            options.print_primary = true;
            continue;
        }
        auto handled = set_store_option(arg, args, idx, options.store, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(keydir::make_error(keydir::errc::kInvalidArgument,
                                                      "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] keydir::Result<ImportOptions> parse_import_args(std::span<char*> args)
{
    ImportOptions options{.store = default_store_options(),
                          .descriptor = std::string{},
                          .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--descriptor") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.descriptor = *value;
            skip_next = true;
            continue;
        }
        auto handled = set_store_option(arg, args, idx, options.store, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(keydir::make_error(keydir::errc::kInvalidArgument,
                                                      "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] keydir::Result<keydir::Database> open_database(const StoreOptions& options)
{
    keydir::StoreConfig store;
    if (options.config) {
        auto config = keydir::load_config(*options.config, options.schema_dir);
        if (!config) {
            return std::unexpected(config.error());
        }
        if (auto level = keydir::logging::set_level(config->log_level); !level) {
            return std::unexpected(level.error());
        }
        store = std::move(config->store);
    } else if (options.base) {
        store = keydir::StoreConfig::from_base(*options.base);
    } else {
        return std::unexpected(keydir::make_error(keydir::errc::kMissingArgument,
                                                  "One of --config or --base is required"));
    }
    store.dry_run = store.dry_run || options.dry_run;
    return keydir::Database::open(store);
}

[[nodiscard]] keydir::Result<keydir::Identifier> parse_identifier(const LookupOptions& options)
{
    const int given = static_cast<int>(options.fingerprint.has_value())
                      + static_cast<int>(options.keyid.has_value())
                      + static_cast<int>(options.email.has_value());
    if (given != 1) {
        return std::unexpected(
            keydir::make_error(keydir::errc::kInvalidArgument,
                               "Exactly one of --fingerprint, --keyid or --email is required"));
    }
    if (options.fingerprint) {
        if (auto fingerprint = keydir::Fingerprint::parse(*options.fingerprint)) {
            return keydir::Identifier{std::move(*fingerprint)};
        }
        return std::unexpected(keydir::make_error(keydir::errc::kInvalidIdentifier,
                                                  "Invalid fingerprint: " + *options.fingerprint));
    }
    if (options.keyid) {
        if (auto key_id = keydir::KeyId::parse(*options.keyid)) {
            return keydir::Identifier{std::move(*key_id)};
        }
        return std::unexpected(
            keydir::make_error(keydir::errc::kInvalidIdentifier, "Invalid key id: " + *options.keyid));
    }
    if (auto email = keydir::Email::parse(*options.email)) {
        return keydir::Identifier{std::move(*email)};
    }
    return std::unexpected(
        keydir::make_error(keydir::errc::kInvalidIdentifier, "Invalid email: " + *options.email));
}

[[nodiscard]] keydir::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            keydir::make_error(keydir::errc::kIOError, "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            keydir::make_error(keydir::errc::kParseError,
                               "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

[[nodiscard]] int run_check(const CheckOptions& options)
{
    auto db = open_database(options.store);
    if (!db) {
        std::println(stderr, "Error: {}", db.error().message);
        return 1;
    }
    keydir::certificate::DescriptorParser parser(options.store.schema_dir);
    auto summary = db->check_consistency(parser);
    if (!summary) {
        std::println(stderr, "Error: [{}] {}", summary.error().code, summary.error().message);
        return 1;
    }

    std::println("[check] Database is consistent");
    std::println("  published records: {}", summary->published_records);
    std::println("  key links: {}", summary->key_links);
    std::println("  email links: {}", summary->email_links);
    return 0;
}

[[nodiscard]] int run_lookup(const LookupOptions& options)
{
    auto identifier = parse_identifier(options);
    if (!identifier) {
        std::println(stderr, "Error: {}", identifier.error().message);
        return 1;
    }
    auto db = open_database(options.store);
    if (!db) {
        std::println(stderr, "Error: {}", db.error().message);
        return 1;
    }

    if (options.print_path) {
        auto path = db->lookup_path(*identifier);
        if (!path) {
            std::println(stderr, "Not found: {}", keydir::to_string(*identifier));
            return 1;
        }
        std::println("{}", path->string());
        return 0;
    }
    if (options.print_primary) {
        auto primary = db->lookup_primary_fingerprint(*identifier);
        if (!primary) {
            std::println(stderr, "Not found: {}", keydir::to_string(*identifier));
            return 1;
        }
        std::println("{}", primary->to_string());
        return 0;
    }

    auto record = db->read_by_index(*identifier);
    if (!record) {
        std::println(stderr, "Error: {}", record.error().message);
        return 1;
    }
    if (!*record) {
        std::println(stderr, "Not found: {}", keydir::to_string(*identifier));
        return 1;
    }
    std::print("{}", **record);
    return 0;
}

[[nodiscard]] int run_import(const ImportOptions& options)
{
    auto payload = read_json_file(options.descriptor);
    if (!payload) {
        std::println(stderr, "Error: {}", payload.error().message);
        return 1;
    }
    auto cert = keydir::certificate::Descriptor::from_json(*payload, options.store.schema_dir);
    if (!cert) {
        std::println(stderr, "Error: {}", cert.error().message);
        return 1;
    }
    auto db = open_database(options.store);
    if (!db) {
        std::println(stderr, "Error: {}", db.error().message);
        return 1;
    }
    auto record = cert->serialize();
    if (!record) {
        std::println(stderr, "Error: {}", record.error().message);
        return 1;
    }
    auto guard = db->lock();
    if (!guard) {
        std::println(stderr, "Error: {}", guard.error().message);
        return 1;
    }
    keydir::certificate::DescriptorParser parser(options.store.schema_dir);
    auto summary = db->import_certificate(*guard, *cert, *record, parser);
    if (!summary) {
        std::println(stderr, "Error: [{}] {}", summary.error().code, summary.error().message);
        return 1;
    }

    std::println("[import] Stored {}", cert->primary_fingerprint().to_string());
    std::println("  keys linked: {}", summary->linked_keys);
    std::println("  emails linked: {}", summary->linked_emails);
    std::println("  keys unlinked: {}", summary->unlinked_keys);
    std::println("  emails unlinked: {}", summary->unlinked_emails);
    std::println("  dry run: {}", db->config().dry_run ? "yes" : "no");
    return 0;
}

int cmd_check(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_check_help();
        return 0;
    }
    return run_check(*options);
}

int cmd_lookup(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_lookup_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_lookup_help();
        return 0;
    }
    return run_lookup(*options);
}

int cmd_import(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_import_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_import_help();
        return 0;
    }
    if (options->descriptor.empty()) {
        std::println(stderr, "Error: --descriptor is required");
        print_import_help();
        return 1;
    }
    return run_import(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "check") {
            return cmd_check(sub_argc, sub_argv);
        }
        if (cmd == "lookup") {
            return cmd_lookup(sub_argc, sub_argv);
        }
        if (cmd == "import") {
            return cmd_import(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
