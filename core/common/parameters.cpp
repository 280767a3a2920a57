#include "parameters.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <cstring>
#include <type_traits>
#include <utility>

namespace hearth {

namespace {

ParameterKind make_kind(ParameterType type, ParameterValue default_value) {
    ParameterKind kind;
    kind.type = type;
    kind.default_value = std::move(default_value);
    return kind;
}

template <typename T>
std::string float_to_string(T value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buffer, result.ptr);
}

template <typename T>
bool parse_unsigned(const std::string &text, ParameterValue &out, std::string &error) {
    uint64_t value = 0;
    const char *end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        error = "'" + text + "' is not an unsigned integer";
        return false;
    }
    if (value > std::numeric_limits<T>::max()) {
        error = "'" + text + "' is out of range";
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

template <typename T>
bool parse_floating(const std::string &text, ParameterValue &out, std::string &error) {
    if (text.empty()) {
        error = "empty number";
        return false;
    }
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        error = "'" + text + "' is not a number";
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

}  // namespace

ParameterKind ParameterKind::boolean(bool default_value) { return make_kind(ParameterType::BOOL, default_value); }

ParameterKind ParameterKind::u8(uint8_t default_value, uint8_t min, uint8_t max) {
    auto kind = make_kind(ParameterType::U8, default_value);
    kind.min = min;
    kind.max = max;
    return kind;
}

ParameterKind ParameterKind::u16(uint16_t default_value, uint16_t min, uint16_t max) {
    auto kind = make_kind(ParameterType::U16, default_value);
    kind.min = min;
    kind.max = max;
    return kind;
}

ParameterKind ParameterKind::u32(uint32_t default_value, uint32_t min, uint32_t max) {
    auto kind = make_kind(ParameterType::U32, default_value);
    kind.min = min;
    kind.max = max;
    return kind;
}

ParameterKind ParameterKind::u64(uint64_t default_value, uint64_t min, uint64_t max) {
    auto kind = make_kind(ParameterType::U64, default_value);
    kind.min = min;
    kind.max = max;
    return kind;
}

ParameterKind ParameterKind::f32(float default_value, float min, float max, float step) {
    auto kind = make_kind(ParameterType::F32, default_value);
    kind.min = min;
    kind.max = max;
    kind.step = step;
    return kind;
}

ParameterKind ParameterKind::f64(double default_value, double min, double max, double step) {
    auto kind = make_kind(ParameterType::F64, default_value);
    kind.min = min;
    kind.max = max;
    kind.step = step;
    return kind;
}

ParameterKind ParameterKind::range_u32(uint32_t min, uint32_t max, uint32_t step, uint32_t default_value) {
    auto kind = make_kind(ParameterType::RANGE_U32, default_value);
    kind.min = min;
    kind.max = max;
    kind.step = step;
    return kind;
}

ParameterKind ParameterKind::range_u64(uint64_t min, uint64_t max, uint64_t step, uint64_t default_value) {
    auto kind = make_kind(ParameterType::RANGE_U64, default_value);
    kind.min = min;
    kind.max = max;
    kind.step = step;
    return kind;
}

ParameterKind ParameterKind::range_f64(double min, double max, double step, double default_value) {
    auto kind = make_kind(ParameterType::RANGE_F64, default_value);
    kind.min = min;
    kind.max = max;
    kind.step = step;
    return kind;
}

ParameterKind ParameterKind::chars_sequence(std::string default_value) {
    return make_kind(ParameterType::CHARS_SEQUENCE, std::move(default_value));
}

bool ParameterKind::operator==(const ParameterKind &other) const {
    return type == other.type && default_value == other.default_value && min == other.min && max == other.max &&
           step == other.step;
}

const char *parameter_type_to_string(ParameterType type) {
    switch (type) {
        case ParameterType::BOOL:
            return "Bool";
        case ParameterType::U8:
            return "U8";
        case ParameterType::U16:
            return "U16";
        case ParameterType::U32:
            return "U32";
        case ParameterType::U64:
            return "U64";
        case ParameterType::F32:
            return "F32";
        case ParameterType::F64:
            return "F64";
        case ParameterType::RANGE_U32:
            return "RangeU32";
        case ParameterType::RANGE_U64:
            return "RangeU64";
        case ParameterType::RANGE_F64:
            return "RangeF64";
        case ParameterType::CHARS_SEQUENCE:
            return "CharsSequence";
        default:
            return "Unknown";
    }
}

std::optional<ParameterType> parameter_type_from_string(std::string_view name) {
    static constexpr ParameterType kTypes[] = {
        ParameterType::BOOL,      ParameterType::U8,        ParameterType::U16,       ParameterType::U32,
        ParameterType::U64,       ParameterType::F32,       ParameterType::F64,       ParameterType::RANGE_U32,
        ParameterType::RANGE_U64, ParameterType::RANGE_F64, ParameterType::CHARS_SEQUENCE,
    };
    for (ParameterType type : kTypes) {
        if (name == parameter_type_to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char *parameter_kind_type_name(const ParameterKind &kind) {
    switch (kind.type) {
        case ParameterType::BOOL:
            return "bool";
        case ParameterType::U8:
            return "u8";
        case ParameterType::U16:
            return "u16";
        case ParameterType::U32:
        case ParameterType::RANGE_U32:
            return "u32";
        case ParameterType::U64:
        case ParameterType::RANGE_U64:
            return "u64";
        case ParameterType::F32:
            return "f32";
        case ParameterType::F64:
        case ParameterType::RANGE_F64:
            return "f64";
        case ParameterType::CHARS_SEQUENCE:
            return "String";
        default:
            return "unknown";
    }
}

const char *parameter_value_type_name(const ParameterValue &value) {
    if (std::holds_alternative<bool>(value)) return "bool";
    if (std::holds_alternative<uint8_t>(value)) return "u8";
    if (std::holds_alternative<uint16_t>(value)) return "u16";
    if (std::holds_alternative<uint32_t>(value)) return "u32";
    if (std::holds_alternative<uint64_t>(value)) return "u64";
    if (std::holds_alternative<float>(value)) return "f32";
    if (std::holds_alternative<double>(value)) return "f64";
    if (std::holds_alternative<std::string>(value)) return "String";
    return "unknown";
}

bool parameter_value_matches_kind(const ParameterKind &kind, const ParameterValue &value) {
    return std::strcmp(parameter_kind_type_name(kind), parameter_value_type_name(value)) == 0;
}

std::string parameter_value_to_string(const ParameterValue &value) {
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_floating_point_v<T>) {
                return float_to_string(v);
            } else {
                return std::to_string(v);
            }
        },
        value);
}

bool parse_parameter_value(const ParameterKind &kind, const std::string &text, ParameterValue &out,
                           std::string &error) {
    switch (kind.type) {
        case ParameterType::BOOL:
            if (text == "true" || text == "1") {
                out = true;
                return true;
            }
            if (text == "false" || text == "0") {
                out = false;
                return true;
            }
            error = "'" + text + "' is not a boolean";
            return false;
        case ParameterType::U8:
            return parse_unsigned<uint8_t>(text, out, error);
        case ParameterType::U16:
            return parse_unsigned<uint16_t>(text, out, error);
        case ParameterType::U32:
        case ParameterType::RANGE_U32:
            return parse_unsigned<uint32_t>(text, out, error);
        case ParameterType::U64:
        case ParameterType::RANGE_U64:
            return parse_unsigned<uint64_t>(text, out, error);
        case ParameterType::F32:
            return parse_floating<float>(text, out, error);
        case ParameterType::F64:
        case ParameterType::RANGE_F64:
            return parse_floating<double>(text, out, error);
        case ParameterType::CHARS_SEQUENCE:
            out = text;
            return true;
        default:
            error = "unsupported parameter type";
            return false;
    }
}

const ParameterEntry *find_parameter(const ParametersSchema &schema, const std::string &name) {
    for (const auto &entry : schema) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace hearth
