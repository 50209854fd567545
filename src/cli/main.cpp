#include "meshcache/Config.hpp"
#include "meshcache/Error.hpp"
#include "meshcache/config/ConfigLoader.hpp"
#include "meshcache/core/CacheAdmission.hpp"
#include "meshcache/core/ReplicationCoordinator.hpp"
#include "meshcache/core/RequestLedger.hpp"
#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/log/StructuredLogger.hpp"
#include "meshcache/network/DatagramTransport.hpp"
#include "meshcache/network/StaticPeerRouter.hpp"
#include "meshcache/protocol/Manifest.hpp"
#include "meshcache/storage/ChunkStore.hpp"
#include "meshcache/storage/ManifestIndex.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#ifndef MESHCACHE_VERSION
#define MESHCACHE_VERSION "v0.1.0"
#endif

namespace {

constexpr std::string_view kMeshcacheVersion = MESHCACHE_VERSION;

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> storage_dir{};
    std::optional<std::uint64_t> capacity_bytes{};
    bool verbose{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_usage() {
    std::cout << "meshcache " << kMeshcacheVersion << std::endl;
    std::cout << "Usage: meshcache [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           JSON configuration file\n"
              << "  --storage <path>          Persistent storage directory (enables persistence)\n"
              << "  --capacity <bytes>        Store capacity in bytes (0 = unbounded)\n"
              << "  --verbose                 Include debug events in the log\n"
              << "  --help                    Show this message\n"
              << "  --version                 Print the version\n\n";
    std::cout << "Commands:\n"
              << "  publish <file>            Split, store and print the manifest id and URI\n"
              << "  status                    Show chunk count, usage and inventory digest\n"
              << "  list                      List chunks from least to most recently used\n"
              << "  verify                    Re-read every chunk and purge corrupt ones\n"
              << "  complete <manifest-uri>   Report whether every chunk of a manifest is stored\n"
              << "  forget <manifest-uri>     Drop a manifest and the chunks only it references\n"
              << "  evict <bytes>             Free at least <bytes> using the admission policy\n";
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::uint64_t parse_byte_count(std::string_view option, const std::string& text) {
    std::uint64_t value{};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        throw_cli_error("E_INVALID_NUMBER",
                        std::string(option) + " expects a non-negative integer",
                        "Example: " + std::string(option) + " 67108864");
    }
    return value;
}

meshcache::Config build_config(const GlobalOptions& options) {
    meshcache::Config config{};
    if (options.config_path) {
        try {
            config = meshcache::config::load_config_file(*options.config_path, config);
        } catch (const meshcache::config::ConfigError& ex) {
            throw_cli_error(ex.reason(), ex.message(), ex.hint());
        }
    }
    if (options.storage_dir) {
        config.storage_directory = *options.storage_dir;
        config.storage_persistent_enabled = true;
    }
    if (options.capacity_bytes) {
        config.store_capacity_bytes = *options.capacity_bytes;
    }
    return config;
}

meshcache::PeerId make_peer_id(const meshcache::Config& config) {
    meshcache::PeerId id{};
    if (config.identity_seed) {
        std::array<std::uint8_t, 4> seed_bytes{};
        const auto seed = *config.identity_seed;
        seed_bytes[0] = static_cast<std::uint8_t>((seed >> 24) & 0xFF);
        seed_bytes[1] = static_cast<std::uint8_t>((seed >> 16) & 0xFF);
        seed_bytes[2] = static_cast<std::uint8_t>((seed >> 8) & 0xFF);
        seed_bytes[3] = static_cast<std::uint8_t>(seed & 0xFF);

        const auto digest = meshcache::crypto::Sha256::digest(seed_bytes);
        std::copy(digest.begin(), digest.end(), id.begin());
        return id;
    }

    std::random_device rd;
    std::mt19937 generator(rd());
    std::uniform_int_distribution<int> distribution(0, 255);
    for (auto& byte : id) {
        byte = static_cast<std::uint8_t>(distribution(generator));
    }
    return id;
}

// Offline node: a transport with no links, so publish only stores locally.
struct LocalNode {
    explicit LocalNode(const meshcache::Config& config)
        : store(config),
          ledger(config),
          admission(config),
          manifests(config),
          router(),
          transport([](const meshcache::PeerId&, std::span<const std::uint8_t>) { return false; }),
          coordinator(make_peer_id(config), config, store, ledger, admission, manifests, transport, router) {
        transport.set_handler(&coordinator);
    }

    meshcache::ChunkStore store;
    meshcache::RequestLedger ledger;
    meshcache::CacheAdmission admission;
    meshcache::ManifestIndex manifests;
    meshcache::network::StaticPeerRouter router;
    meshcache::network::DatagramTransport transport;
    meshcache::ReplicationCoordinator coordinator;
};

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw_cli_error("E_FILE_NOT_FOUND",
                        "Unable to open file: " + path.string(),
                        "Verify the path or provide an absolute path");
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

void expect_no_more_args(const std::vector<std::string_view>& args, std::size_t index, std::string_view command) {
    if (index < args.size()) {
        throw_cli_error("E_UNEXPECTED_ARGUMENT",
                        "Unexpected argument for " + std::string(command) + ": " + std::string(args[index]),
                        "Run 'meshcache --help' for usage");
    }
}

meshcache::protocol::FileManifest parse_manifest_uri(const std::string& uri) {
    try {
        return meshcache::protocol::manifest_from_uri(uri);
    } catch (const meshcache::Error& ex) {
        throw_cli_error("E_INVALID_MANIFEST", ex.message(), "Pass the mesh:// URI printed by 'meshcache publish'");
    }
}

int run_publish(LocalNode& node, const std::filesystem::path& path) {
    const auto payload = read_file(path);
    const auto manifest = node.coordinator.publish(payload, path.filename().string(), {});
    std::cout << "Manifest: " << meshcache::chunk_id_to_string(manifest.manifest_id) << std::endl;
    std::cout << "Chunks:   " << manifest.chunks.size() << " (" << format_bytes(manifest.total_size) << ")"
              << std::endl;
    std::cout << "URI:      " << meshcache::protocol::manifest_to_uri(manifest) << std::endl;
    return 0;
}

int run_status(LocalNode& node) {
    const auto capacity = node.store.capacity_bytes();
    std::cout << "Chunks:      " << node.store.chunk_count() << std::endl;
    std::cout << "Used:        " << format_bytes(node.store.used_bytes()) << std::endl;
    std::cout << "Capacity:    " << (capacity == 0 ? std::string{"unbounded"} : format_bytes(capacity)) << std::endl;
    std::cout << "Utilization: " << std::fixed << std::setprecision(1) << node.store.utilization() * 100.0 << "%"
              << std::endl;
    std::cout << "Manifests:   " << node.manifests.size() << std::endl;
    const auto digest = node.store.inventory_digest();
    std::cout << "Inventory:   " << to_hex(digest) << std::endl;
    return 0;
}

int run_list(LocalNode& node) {
    const auto chunks = node.store.list_by_access_order();
    if (chunks.empty()) {
        std::cout << "Store is empty" << std::endl;
        return 0;
    }
    for (const auto& chunk : chunks) {
        std::cout << meshcache::chunk_id_to_string(chunk.id) << "  " << std::setw(10) << format_bytes(chunk.size)
                  << "  hops=";
        if (chunk.hop_distance == meshcache::kUnknownHops) {
            std::cout << "?";
        } else {
            std::cout << static_cast<int>(chunk.hop_distance);
        }
        std::cout << "  reads=" << chunk.access_count << std::endl;
    }
    return 0;
}

int run_verify(LocalNode& node) {
    const auto reconciled = node.store.reconcile();
    const auto purged = node.store.verify_all();
    std::cout << "Orphan files removed:     " << reconciled.orphan_files_removed << std::endl;
    std::cout << "Missing payloads dropped: " << reconciled.missing_payloads_dropped << std::endl;
    std::cout << "Corrupt chunks purged:    " << purged.size() << std::endl;
    for (const auto& id : purged) {
        std::cout << "  " << meshcache::chunk_id_to_string(id) << std::endl;
    }
    return purged.empty() ? 0 : 1;
}

int run_complete(LocalNode& node, const std::string& uri) {
    const auto manifest = parse_manifest_uri(uri);

    std::size_t present = 0;
    for (const auto& id : manifest.chunks) {
        if (node.store.has(id)) {
            ++present;
        }
    }
    const bool complete = present == manifest.chunks.size();
    std::cout << manifest.name << ": " << present << "/" << manifest.chunks.size() << " chunks stored"
              << (complete ? " (complete)" : "") << std::endl;
    return complete ? 0 : 1;
}

int run_forget(LocalNode& node, const std::string& uri) {
    const auto manifest = parse_manifest_uri(uri);
    const auto report = node.coordinator.forget_manifest(manifest.manifest_id);
    if (!report) {
        throw_cli_error("E_MANIFEST_UNKNOWN",
                        "Manifest " + meshcache::short_id(manifest.manifest_id) + " is not indexed on this node",
                        "Check that --storage points at the directory it was published into");
    }
    std::cout << "Forgot " << manifest.name << ": removed " << report->chunks_removed << " chunk(s), kept "
              << report->chunks_shared << " shared" << std::endl;
    return 0;
}

int run_evict(LocalNode& node, std::uint64_t target) {
    const auto snapshot = node.store.list_by_access_order();
    const auto victims = node.admission.select_evictions(snapshot, target, [&](const meshcache::ChunkId& id) {
        return node.coordinator.is_retained(id);
    });
    if (victims.empty() && target > 0) {
        throw_cli_error("E_EVICT_UNREACHABLE",
                        "Cannot free " + format_bytes(target) + " without touching pinned chunks",
                        "Lower the amount, or forget a published manifest to release its chunks");
    }

    std::uint64_t freed = 0;
    for (const auto& id : victims) {
        const auto meta = node.store.metadata(id);
        if (node.store.remove(id) && meta) {
            freed += meta->size;
        }
    }
    std::cout << "Evicted " << victims.size() << " chunk(s), freed " << format_bytes(freed) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        std::vector<std::string_view> positional;

        while (index < args.size()) {
            const auto opt = args[index];
            if (!opt.starts_with("-")) {
                if (!command) {
                    command = std::string(opt);
                } else {
                    positional.push_back(opt);
                }
                ++index;
                continue;
            }

            ++index;
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "meshcache " << kMeshcacheVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--storage") {
                options.storage_dir = require_value(opt);
                continue;
            }
            if (opt == "--capacity") {
                options.capacity_bytes = parse_byte_count(opt, require_value(opt));
                continue;
            }
            if (opt == "--verbose") {
                options.verbose = true;
                continue;
            }

            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'meshcache --help' to view available options");
        }

        if (!command) {
            print_usage();
            return 1;
        }
        if (*command == "help") {
            print_usage();
            return 0;
        }

        const auto config = build_config(options);
        meshcache::log::StructuredLogger::instance().set_enabled(config.log_enabled);
        if (options.verbose) {
            meshcache::log::StructuredLogger::instance().set_minimum_level(
                meshcache::log::StructuredLogger::Level::Debug);
        }

        std::size_t arg_index = 0;
        auto require_argument = [&](std::string_view what) -> std::string {
            if (arg_index >= positional.size()) {
                throw_cli_error("E_MISSING_ARGUMENT",
                                *command + " requires " + std::string(what),
                                "Run 'meshcache --help' for usage");
            }
            return std::string(positional[arg_index++]);
        };

        if (*command == "publish") {
            const auto path = require_argument("a file path");
            expect_no_more_args(positional, arg_index, *command);
            if (!config.storage_persistent_enabled) {
                throw_cli_error("E_STORAGE_REQUIRED",
                                "publish needs a persistent store; an in-memory store is discarded on exit",
                                "Pass --storage <path> or set storage.persistent in the configuration file");
            }
            LocalNode node(config);
            return run_publish(node, path);
        }
        if (*command == "status") {
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_status(node);
        }
        if (*command == "list") {
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_list(node);
        }
        if (*command == "verify") {
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_verify(node);
        }
        if (*command == "complete") {
            const auto uri = require_argument("a manifest URI");
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_complete(node, uri);
        }
        if (*command == "forget") {
            const auto uri = require_argument("a manifest URI");
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_forget(node, uri);
        }
        if (*command == "evict") {
            const auto target = parse_byte_count("evict", require_argument("a byte count"));
            expect_no_more_args(positional, arg_index, *command);
            LocalNode node(config);
            return run_evict(node, target);
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'meshcache --help' to see the list of available commands");

    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const meshcache::Error& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
