#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hearth {

/**
 * @brief Parameter kinds a device route may declare.
 *
 * Range kinds describe an inclusive [min, max] interval walked by step and
 * are matched by their underlying numeric type (u32, u64, f64).
 */
enum class ParameterType { BOOL, U8, U16, U32, U64, F32, F64, RANGE_U32, RANGE_U64, RANGE_F64, CHARS_SEQUENCE };

/**
 * @brief Runtime value supplied for (or declared as default of) a parameter.
 */
using ParameterValue = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, float, double, std::string>;

/**
 * @brief Schema entry for one route parameter.
 *
 * min/max apply to numeric kinds, step to float and range kinds.
 */
struct ParameterKind {
    ParameterType type = ParameterType::BOOL;
    ParameterValue default_value = false;
    std::optional<ParameterValue> min;
    std::optional<ParameterValue> max;
    std::optional<ParameterValue> step;

    static ParameterKind boolean(bool default_value);
    static ParameterKind u8(uint8_t default_value, uint8_t min, uint8_t max);
    static ParameterKind u16(uint16_t default_value, uint16_t min, uint16_t max);
    static ParameterKind u32(uint32_t default_value, uint32_t min, uint32_t max);
    static ParameterKind u64(uint64_t default_value, uint64_t min, uint64_t max);
    static ParameterKind f32(float default_value, float min, float max, float step);
    static ParameterKind f64(double default_value, double min, double max, double step);
    static ParameterKind range_u32(uint32_t min, uint32_t max, uint32_t step, uint32_t default_value);
    static ParameterKind range_u64(uint64_t min, uint64_t max, uint64_t step, uint64_t default_value);
    static ParameterKind range_f64(double min, double max, double step, double default_value);
    static ParameterKind chars_sequence(std::string default_value);

    bool operator==(const ParameterKind &other) const;
    bool operator!=(const ParameterKind &other) const { return !(*this == other); }
};

struct ParameterEntry {
    std::string name;
    ParameterKind kind;
};

// Declaration order is significant: path segments follow it.
using ParametersSchema = std::vector<ParameterEntry>;

// Caller-supplied values keyed by parameter name
using ParametersValues = std::map<std::string, ParameterValue>;

/**
 * @brief Name of the kind as declared by the device ("RangeU64", "CharsSequence", ...).
 */
const char *parameter_type_to_string(ParameterType type);

std::optional<ParameterType> parameter_type_from_string(std::string_view name);

/**
 * @brief Value type a kind accepts ("bool", "u8", ..., "f64", "String").
 */
const char *parameter_kind_type_name(const ParameterKind &kind);

/**
 * @brief Value type held by a ParameterValue.
 */
const char *parameter_value_type_name(const ParameterValue &value);

/**
 * @brief Check whether a value is acceptable for a declared kind.
 */
bool parameter_value_matches_kind(const ParameterKind &kind, const ParameterValue &value);

/**
 * @brief Decimal text form of a value; floats use the shortest round-trip form.
 */
std::string parameter_value_to_string(const ParameterValue &value);

/**
 * @brief Parse textual input ("true", "42", "0.5") into the value type of kind.
 *
 * Integers must fit the kind's base type. Range bounds are not enforced.
 */
bool parse_parameter_value(const ParameterKind &kind, const std::string &text, ParameterValue &out,
                           std::string &error);

const ParameterEntry *find_parameter(const ParametersSchema &schema, const std::string &name);

}  // namespace hearth
