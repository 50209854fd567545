#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Error.hpp"
#include "meshcache/Export.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace meshcache::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    bool is_object() const { return type == ValueType::Object; }
    bool is_number() const { return type == ValueType::Integer || type == ValueType::Double; }
};

// Error{Config} carrying the finer E_CONFIG_* reason shown to the user.
class MESHCACHE_API ConfigError : public Error {
public:
    ConfigError(std::string reason, std::string message, std::string hint = {});

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string reason_;
    std::string formatted_;
};

MESHCACHE_API Value parse_json(const std::string& text);

// Applies every recognised key of document onto config. Unknown keys are ignored.
MESHCACHE_API void apply_document(const Value& document, Config& config);

MESHCACHE_API Config load_config_text(const std::string& text, Config defaults = {});
MESHCACHE_API Config load_config_file(const std::filesystem::path& path, Config defaults = {});

}  // namespace meshcache::config
