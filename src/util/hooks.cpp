#include <cuuid/hooks.hpp>
#include <cuuid/log.hpp>

namespace cuuid {

const char* node_type_name(toml::node_type type) {
    switch (type) {
        case toml::node_type::none:           return "none";
        case toml::node_type::table:          return "table";
        case toml::node_type::array:          return "array";
        case toml::node_type::string:         return "string";
        case toml::node_type::integer:        return "integer";
        case toml::node_type::floating_point: return "float";
        case toml::node_type::boolean:        return "boolean";
        case toml::node_type::date:           return "date";
        case toml::node_type::time:           return "time";
        case toml::node_type::date_time:      return "date-time";
    }
    return "unknown";
}

static CuuidError to_validation(const CuuidError& cause, const std::string& context) {
    CuuidError e{CuuidError::Validation, context + ": " + cause.message, cause.hint};
    e.character = cause.character;
    e.position = cause.position;
    e.length = cause.length;
    return e;
}

Result<Uuid> decode_hook(const toml::node& node) {
    const auto* str = node.as_string();
    if (!str) {
        return CuuidError{CuuidError::Validation,
            std::string("expected string for CrockfordUUID, got ") +
            node_type_name(node.type())};
    }

    auto u = Uuid::from_string(str->get());
    if (u.is_err()) {
        log::debug("rejecting CrockfordUUID '%s': %s",
                   str->get().c_str(), u.error().message.c_str());
        return to_validation(u.error(), "invalid CrockfordUUID");
    }
    return u;
}

toml::value<std::string> encode_hook(const Uuid& u) {
    return toml::value<std::string>{u.to_string()};
}

Result<Uuid> read_uuid(const toml::table& tbl, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return CuuidError{CuuidError::Validation,
            "missing required field '" + std::string(key) + "'"};
    }
    return decode_hook(*node).map_err([&](CuuidError& e) {
        e.message = "field '" + std::string(key) + "': " + e.message;
        return e;
    });
}

void write_uuid(toml::table& tbl, std::string_view key, const Uuid& u) {
    tbl.insert_or_assign(key, encode_hook(u));
}

} // namespace cuuid
