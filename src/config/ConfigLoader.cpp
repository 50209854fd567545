#include "meshcache/config/ConfigLoader.hpp"

#include "meshcache/log/StructuredLogger.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

namespace meshcache::config {

namespace {

constexpr std::size_t kWireChunkCeiling = 1024u * 1024u;

Value make_value(ValueType type) {
    Value value;
    value.type = type;
    return value;
}

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected trailing content in JSON config");
        }
        return value;
    }

private:
    const std::string& text_;
    std::size_t position_{0};

    bool at_end() const { return position_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[position_]; }

    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end()) {
            const char ch = peek();
            if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
                ++position_;
            } else {
                break;
            }
        }
    }

    Value parse_value() {
        skip_whitespace();
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing value");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (ch == '"') {
            auto value = make_value(ValueType::String);
            value.string_value = parse_string();
            return value;
        }
        if (ch == 't' || ch == 'f') {
            auto value = make_value(ValueType::Boolean);
            value.boolean_value = parse_boolean();
            return value;
        }
        if (ch == 'n') {
            parse_null();
            return Value{};
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        throw ConfigError("E_CONFIG_PARSE", "Unexpected token in JSON value");
    }

    Value parse_object() {
        auto object = make_value(ValueType::Object);
        get();  // '{'
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                throw ConfigError("E_CONFIG_PARSE", "Expected string key in JSON object");
            }
            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ':' after key in JSON object");
            }
            Value value = parse_value();
            object.object_value.insert_or_assign(std::move(key), std::move(value));

            skip_whitespace();
            if (at_end()) {
                throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing object");
            }
            const char ch = get();
            if (ch == '}') {
                break;
            }
            if (ch != ',') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ',' or '}' in JSON object");
            }
        }
        return object;
    }

    Value parse_array() {
        auto array = make_value(ValueType::Array);
        get();  // '['
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }

        while (true) {
            array.array_value.push_back(parse_value());
            skip_whitespace();
            if (at_end()) {
                throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing array");
            }
            const char ch = get();
            if (ch == ']') {
                break;
            }
            if (ch != ',') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ',' or ']' in JSON array");
            }
        }
        return array;
    }

    std::string parse_string() {
        if (get() != '"') {
            throw ConfigError("E_CONFIG_PARSE", "Expected opening quote for JSON string");
        }

        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (ch != '\\') {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    throw ConfigError("E_CONFIG_PARSE", "Control characters must be escaped in JSON strings");
                }
                result.push_back(ch);
                continue;
            }

            if (at_end()) {
                throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in JSON string");
            }
            const char esc = get();
            switch (esc) {
            case '"':
            case '\\':
            case '/':
                result.push_back(esc);
                break;
            case 'b':
                result.push_back('\b');
                break;
            case 'f':
                result.push_back('\f');
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 'r':
                result.push_back('\r');
                break;
            case 't':
                result.push_back('\t');
                break;
            case 'u':
                result += parse_unicode_escape();
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", "Unsupported escape sequence in JSON string");
            }
        }

        throw ConfigError("E_CONFIG_PARSE", "Unterminated JSON string literal");
    }

    std::string parse_unicode_escape() {
        if (position_ + 4 > text_.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete unicode escape in JSON string");
        }
        unsigned int code_point = 0;
        const auto result = std::from_chars(text_.data() + position_, text_.data() + position_ + 4, code_point, 16);
        if (result.ec != std::errc{} || result.ptr != text_.data() + position_ + 4) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid hex digit in unicode escape");
        }
        position_ += 4;

        std::string utf8;
        if (code_point <= 0x7F) {
            utf8.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            utf8.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
            utf8.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            utf8.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
            utf8.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            utf8.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
        return utf8;
    }

    Value parse_number() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        bool is_fractional = false;
        if (peek() == '.') {
            is_fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            is_fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }

        const std::string token = text_.substr(start, position_ - start);
        if (is_fractional) {
            char* end = nullptr;
            const double parsed = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size() || !std::isfinite(parsed)) {
                throw ConfigError("E_CONFIG_PARSE", "Invalid floating point number in JSON");
            }
            auto value = make_value(ValueType::Double);
            value.double_value = parsed;
            return value;
        }

        std::int64_t parsed{};
        const auto result = std::from_chars(token.data(), token.data() + token.size(), parsed);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid integer number in JSON");
        }
        auto value = make_value(ValueType::Integer);
        value.integer_value = parsed;
        return value;
    }

    bool parse_boolean() {
        if (text_.compare(position_, 4, "true") == 0) {
            position_ += 4;
            return true;
        }
        if (text_.compare(position_, 5, "false") == 0) {
            position_ += 5;
            return false;
        }
        throw ConfigError("E_CONFIG_PARSE", "Invalid boolean literal in JSON");
    }

    void parse_null() {
        if (text_.compare(position_, 4, "null") != 0) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid null literal in JSON");
        }
        position_ += 4;
    }
};

// Walks a dotted path such as "storage.capacity_bytes".
const Value* find_path(const Value& root, std::string_view path) {
    const Value* current = &root;
    while (!path.empty()) {
        if (!current->is_object()) {
            return nullptr;
        }
        const auto dot = path.find('.');
        const std::string key(path.substr(0, dot));
        const auto it = current->object_value.find(key);
        if (it == current->object_value.end()) {
            return nullptr;
        }
        current = &it->second;
        path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
    }
    return current;
}

std::optional<std::string> get_string(const Value& root, std::string_view path) {
    const auto* value = find_path(root, path);
    if (!value || value->type == ValueType::Null) {
        return std::nullopt;
    }
    if (value->type != ValueType::String) {
        throw ConfigError("E_CONFIG_TYPE", "Expected string for '" + std::string(path) + "'");
    }
    return value->string_value;
}

std::optional<bool> get_bool(const Value& root, std::string_view path) {
    const auto* value = find_path(root, path);
    if (!value || value->type == ValueType::Null) {
        return std::nullopt;
    }
    if (value->type != ValueType::Boolean) {
        throw ConfigError("E_CONFIG_TYPE", "Expected boolean for '" + std::string(path) + "'");
    }
    return value->boolean_value;
}

std::optional<std::int64_t> get_int64(const Value& root, std::string_view path) {
    const auto* value = find_path(root, path);
    if (!value || value->type == ValueType::Null) {
        return std::nullopt;
    }
    if (value->type != ValueType::Integer) {
        throw ConfigError("E_CONFIG_TYPE", "Expected integer for '" + std::string(path) + "'");
    }
    return value->integer_value;
}

std::optional<double> get_double(const Value& root, std::string_view path) {
    const auto* value = find_path(root, path);
    if (!value || value->type == ValueType::Null) {
        return std::nullopt;
    }
    if (value->type == ValueType::Double) {
        return value->double_value;
    }
    if (value->type == ValueType::Integer) {
        return static_cast<double>(value->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected number for '" + std::string(path) + "'");
}

[[noreturn]] void out_of_range(std::string_view path, std::string_view expectation) {
    throw ConfigError("E_CONFIG_VALUE",
                      "Value for '" + std::string(path) + "' is out of range",
                      "Expected " + std::string(expectation));
}

std::uint64_t require_range(std::string_view path,
                            std::int64_t value,
                            std::int64_t minimum,
                            std::int64_t maximum,
                            std::string_view expectation) {
    if (value < minimum || value > maximum) {
        out_of_range(path, expectation);
    }
    return static_cast<std::uint64_t>(value);
}

std::chrono::seconds read_seconds(const Value& root, std::string_view path, std::chrono::seconds current) {
    const auto value = get_int64(root, path);
    if (!value) {
        return current;
    }
    require_range(path, *value, 1, std::numeric_limits<std::int32_t>::max(), "a positive number of seconds");
    return std::chrono::seconds(*value);
}

double read_weight(const Value& root, std::string_view path, double current) {
    const auto value = get_double(root, path);
    if (!value) {
        return current;
    }
    if (*value < 0.0) {
        out_of_range(path, "a non-negative weight");
    }
    return *value;
}

}  // namespace

ConfigError::ConfigError(std::string reason, std::string message, std::string hint)
    : Error(ErrorCode::Config, message, std::move(hint)),
      reason_(std::move(reason)),
      formatted_("[" + reason_ + "] " + message) {}

Value parse_json(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

void apply_document(const Value& document, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a JSON object");
    }

    if (const auto persistent = get_bool(document, "storage.persistent")) {
        config.storage_persistent_enabled = *persistent;
    }
    if (const auto directory = get_string(document, "storage.directory")) {
        if (directory->empty()) {
            out_of_range("storage.directory", "a non-empty path");
        }
        config.storage_directory = *directory;
    }
    if (const auto capacity = get_int64(document, "storage.capacity_bytes")) {
        config.store_capacity_bytes = require_range("storage.capacity_bytes",
                                                    *capacity,
                                                    0,
                                                    std::numeric_limits<std::int64_t>::max(),
                                                    "zero (unbounded) or a positive byte count");
    }
    if (const auto max_chunk = get_int64(document, "storage.max_chunk_bytes")) {
        config.max_chunk_bytes = static_cast<std::size_t>(require_range("storage.max_chunk_bytes",
                                                                        *max_chunk,
                                                                        1,
                                                                        static_cast<std::int64_t>(kWireChunkCeiling),
                                                                        "1..1048576 bytes"));
    }
    if (const auto chunk_size = get_int64(document, "storage.chunk_size")) {
        config.chunk_size = static_cast<std::size_t>(
            require_range("storage.chunk_size", *chunk_size, 1, std::numeric_limits<std::int64_t>::max(),
                          "a positive byte count"));
    }
    if (config.chunk_size > config.max_chunk_bytes) {
        out_of_range("storage.chunk_size", "a value no larger than storage.max_chunk_bytes");
    }

    if (const auto high_water = get_double(document, "admission.high_water")) {
        if (!(*high_water > 0.0 && *high_water <= 1.0)) {
            out_of_range("admission.high_water", "a ratio in (0, 1]");
        }
        config.admission_high_water = *high_water;
    }
    if (const auto standby = get_int64(document, "admission.standby_queue_limit")) {
        config.standby_queue_limit = static_cast<std::size_t>(require_range("admission.standby_queue_limit", *standby, 0, 1'000'000, "0..1000000 entries"));
    }
    auto& weights = config.admission_weights;
    weights.demand = read_weight(document, "admission.weights.demand", weights.demand);
    weights.recency = read_weight(document, "admission.weights.recency", weights.recency);
    weights.locality = read_weight(document, "admission.weights.locality", weights.locality);
    weights.size_penalty = read_weight(document, "admission.weights.size_penalty", weights.size_penalty);

    if (const auto attempts = get_int64(document, "retry.attempt_limit")) {
        config.fetch_retry_attempt_limit =
            static_cast<std::uint8_t>(require_range("retry.attempt_limit", *attempts, 1, 255, "1..255"));
    }
    config.fetch_retry_initial_backoff =
        read_seconds(document, "retry.initial_backoff_seconds", config.fetch_retry_initial_backoff);
    config.fetch_retry_max_backoff = read_seconds(document, "retry.max_backoff_seconds", config.fetch_retry_max_backoff);
    if (config.fetch_retry_max_backoff < config.fetch_retry_initial_backoff) {
        out_of_range("retry.max_backoff_seconds", "a value no smaller than retry.initial_backoff_seconds");
    }
    config.request_timeout = read_seconds(document, "retry.request_timeout_seconds", config.request_timeout);
    config.ledger_resolved_grace = read_seconds(document, "retry.resolved_grace_seconds", config.ledger_resolved_grace);
    config.offer_ttl = read_seconds(document, "retry.offer_ttl_seconds", config.offer_ttl);

    if (const auto relay = get_bool(document, "replication.relay")) {
        config.relay_enabled = *relay;
    }
    if (const auto auto_fetch = get_int64(document, "replication.auto_fetch_max_bytes")) {
        config.auto_fetch_max_bytes = require_range("replication.auto_fetch_max_bytes",
                                                    *auto_fetch,
                                                    0,
                                                    std::numeric_limits<std::uint32_t>::max(),
                                                    "0..4294967295 bytes");
    }
    if (const auto fanout = get_int64(document, "replication.offer_fanout")) {
        config.offer_fanout = static_cast<std::uint16_t>(require_range("replication.offer_fanout", *fanout, 0, std::numeric_limits<std::uint16_t>::max(), "0..65535"));
    }
    if (const auto fanout = get_int64(document, "replication.fetch_source_fanout")) {
        config.fetch_source_fanout = static_cast<std::uint16_t>(require_range("replication.fetch_source_fanout",
                                                                              *fanout,
                                                                              1,
                                                                              std::numeric_limits<std::uint16_t>::max(),
                                                                              "1..65535"));
    }

    if (const auto seed = get_int64(document, "identity_seed")) {
        config.identity_seed = static_cast<std::uint32_t>(require_range("identity_seed", *seed, 0, std::numeric_limits<std::uint32_t>::max(), "0..4294967295"));
    }
    if (const auto enabled = get_bool(document, "logging.enabled")) {
        config.log_enabled = *enabled;
    }
}

Config load_config_text(const std::string& text, Config defaults) {
    const auto document = parse_json(text);
    apply_document(document, defaults);
    return defaults;
}

Config load_config_file(const std::filesystem::path& path, Config defaults) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Unable to open configuration file: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto config = load_config_text(buffer.str(), std::move(defaults));
    log::log_event(log::StructuredLogger::Level::Info, "config.loaded", {{"path", path.string()}});
    return config;
}

}  // namespace meshcache::config
