#include "meshcache/config/ConfigLoader.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace std::chrono_literals;

namespace {

std::string reason_of(const std::string& text) {
    try {
        meshcache::config::load_config_text(text);
    } catch (const meshcache::config::ConfigError& error) {
        assert(error.code() == meshcache::ErrorCode::Config);
        return error.reason();
    }
    return {};
}

}  // namespace

int main() {
    meshcache::test::silence_logs();

    const auto config = meshcache::config::load_config_text(R"({
        "storage": {
            "persistent": true,
            "directory": "/var/lib/meshcache",
            "capacity_bytes": 1048576,
            "chunk_size": 4096,
            "max_chunk_bytes": 65536
        },
        "admission": {
            "high_water": 0.75,
            "standby_queue_limit": 8,
            "weights": { "demand": 2, "recency": 1.5, "locality": 0.25, "size_penalty": 0 }
        },
        "retry": {
            "attempt_limit": 7,
            "initial_backoff_seconds": 2,
            "max_backoff_seconds": 30,
            "request_timeout_seconds": 12,
            "resolved_grace_seconds": 40,
            "offer_ttl_seconds": 300
        },
        "replication": {
            "relay": false,
            "auto_fetch_max_bytes": 20480,
            "offer_fanout": 5,
            "fetch_source_fanout": 2
        },
        "identity_seed": 42,
        "logging": { "enabled": false },
        "unrelated": ["ignored", 1, null]
    })");

    assert(config.storage_persistent_enabled);
    assert(config.storage_directory == "/var/lib/meshcache");
    assert(config.store_capacity_bytes == 1048576);
    assert(config.chunk_size == 4096);
    assert(config.max_chunk_bytes == 65536);
    assert(config.admission_high_water == 0.75);
    assert(config.standby_queue_limit == 8);
    assert(config.admission_weights.demand == 2.0);
    assert(config.admission_weights.recency == 1.5);
    assert(config.admission_weights.locality == 0.25);
    assert(config.admission_weights.size_penalty == 0.0);
    assert(config.fetch_retry_attempt_limit == 7);
    assert(config.fetch_retry_initial_backoff == 2s);
    assert(config.fetch_retry_max_backoff == 30s);
    assert(config.request_timeout == 12s);
    assert(config.ledger_resolved_grace == 40s);
    assert(config.offer_ttl == 300s);
    assert(!config.relay_enabled);
    assert(config.auto_fetch_max_bytes == 20480);
    assert(config.offer_fanout == 5);
    assert(config.fetch_source_fanout == 2);
    assert(config.identity_seed.has_value() && *config.identity_seed == 42u);
    assert(!config.log_enabled);

    // Keys left out keep the defaults passed in.
    meshcache::Config defaults{};
    defaults.chunk_size = 2048;
    const auto partial = meshcache::config::load_config_text(R"({"retry": {"attempt_limit": 2}})", defaults);
    assert(partial.chunk_size == 2048);
    assert(partial.fetch_retry_attempt_limit == 2);
    assert(partial.request_timeout == meshcache::Config{}.request_timeout);

    const auto escaped = meshcache::config::parse_json(R"({"name": "café \"mesh\"\n"})");
    assert(escaped.object_value.at("name").string_value == "caf\xC3\xA9 \"mesh\"\n");

    assert(reason_of(R"({"storage": {)") == "E_CONFIG_PARSE");
    assert(reason_of(R"({"a": 1} trailing)") == "E_CONFIG_PARSE");
    assert(reason_of(R"({"a": tru})") == "E_CONFIG_PARSE");
    assert(reason_of(R"([1, 2])") == "E_CONFIG_STRUCTURE");
    assert(reason_of(R"({"storage": {"persistent": "yes"}})") == "E_CONFIG_TYPE");
    assert(reason_of(R"({"retry": {"attempt_limit": 1.5}})") == "E_CONFIG_TYPE");
    assert(reason_of(R"({"retry": {"attempt_limit": 0}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"retry": {"attempt_limit": 256}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"retry": {"request_timeout_seconds": 0}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"admission": {"high_water": 1.5}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"admission": {"high_water": 0}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"storage": {"chunk_size": 0}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"storage": {"chunk_size": 300000}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"storage": {"max_chunk_bytes": 2000000}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"replication": {"offer_fanout": 70000}})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"identity_seed": -1})") == "E_CONFIG_VALUE");
    assert(reason_of(R"({"admission": {"weights": {"demand": -1}}})") == "E_CONFIG_VALUE");

    bool missing_raised = false;
    try {
        meshcache::config::load_config_file("/nonexistent/meshcache.json");
    } catch (const meshcache::config::ConfigError& error) {
        missing_raised = error.reason() == "E_CONFIG_NOT_FOUND";
        assert(!error.hint().empty());
        assert(std::string(error.what()).rfind("[E_CONFIG_NOT_FOUND]", 0) == 0);
    }
    assert(missing_raised);

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto path = std::filesystem::temp_directory_path() / ("meshcache_config_" + std::to_string(stamp) + ".json");
    {
        std::ofstream out(path);
        out << R"({"storage": {"capacity_bytes": 0}, "replication": {"offer_fanout": 0}})";
    }
    const auto from_file = meshcache::config::load_config_file(path);
    assert(from_file.store_capacity_bytes == 0);
    assert(from_file.offer_fanout == 0);
    std::filesystem::remove(path);
    return 0;
}
