//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description: Typed wrappers for the values of a configuration section. A field tracks whether it has been modified
// at runtime (e.g. by a command line flag) so that a later merge of the configuration file will not clobber it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires(T t)
{
    { static_cast<std::string_view>(t) } -> std::same_as<std::string_view>;
};

template <std::size_t SourceSize>
constexpr std::size_t GetSnakeCaseSize(char const (&source)[SourceSize])
{
    std::size_t size = SourceSize > 0 ? 1 : 0;
    for (std::size_t idx = 1; idx < SourceSize; ++idx) {
        if (source[idx] >= 'A' && source[idx] <= 'Z' && source[idx - 1] >= 'a' && source[idx - 1] <= 'z') {
            ++size;
        }
        ++size;
    }
    return size;
}

template <std::size_t DestinationSize, std::size_t SourceSize>
constexpr auto ConvertToSnakeCase(char const (&source)[SourceSize])
{
    std::array<char, DestinationSize> converted{};

    std::size_t idx = 0;
    for (std::size_t jdx = 0; jdx < SourceSize - 1; ++jdx) {
        if (source[jdx] >= 'A' && source[jdx] <= 'Z') {
            if (jdx > 0 && source[jdx - 1] >= 'a' && source[jdx - 1] <= 'z') { converted[idx++] = '_'; }
            converted[idx++] = static_cast<char>(source[jdx] - 'A' + 'a');
        } else {
            converted[idx++] = source[jdx];
        }
    }

    converted[idx] = '\0';
    return converted;
}

// Defines a tag type whose name is the snake cased field name (e.g. ChunkSize -> "chunk_size").
#define DEFINE_FIELD_NAME(name) \
    struct name { \
        static constexpr auto FieldName = ConvertToSnakeCase<GetSnakeCaseSize(#name)>(#name); \
        static constexpr std::string_view GetFieldName() { return FieldName.data(); } \
        constexpr operator std::string_view() const { return FieldName.data(); } \
    }

//----------------------------------------------------------------------------------------------------------------------

template<FieldNameTag NameTag, typename ValueType>
class Field
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr std::string_view FieldName = NameTag{};
    static constexpr auto DefaultValidator = [] (ValueType const&) { return true; };

    explicit Field(Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_value()
        , m_validator(validator)
    {
    }

    explicit Field(ValueType value, Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_value(std::move(value))
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(Field const& other) const noexcept { return m_value == other.m_value; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }

    [[nodiscard]] ValueType const& GetValue() const { return m_value; }
    [[nodiscard]] bool WouldMatchDefault(ValueType const& defaultValue) const { return m_value == defaultValue; }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }
    void ClearModifiedFlag() { m_modified = false; }

    // Runtime updates mark the field as modified, such that the value takes precedence over the file's value.
    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (value == m_value) { return true; }
        if (!m_validator(value)) { return false; }
        m_value = value;
        m_modified = true;
        return true;
    }

    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (value == m_value) { return true; }
        if (!m_validator(value)) { return false; }
        m_value = value;
        return true;
    }

protected:
    bool m_modified;
    ValueType m_value;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

template<FieldNameTag NameTag, typename ValueType>
class OptionalField
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr std::string_view FieldName = NameTag{};
    static constexpr auto DefaultValidator = [] (ValueType const&) { return true; };

    explicit OptionalField(Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_optValue()
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(OptionalField const& other) const noexcept { return m_optValue == other.m_optValue; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }

    [[nodiscard]] bool HasValue() const { return m_optValue.has_value(); }
    [[nodiscard]] ValueType const& GetValue() const { return *m_optValue; }
    [[nodiscard]] std::optional<ValueType> const& GetOptionalValue() const { return m_optValue; }
    [[nodiscard]] ValueType GetValueOrElse(ValueType const& defaultValue) const
    {
        return m_optValue.value_or(defaultValue);
    }

    // An unset value will resolve to the default, it is therefore considered a match.
    [[nodiscard]] bool WouldMatchDefault(ValueType const& defaultValue) const
    {
        return !m_optValue || *m_optValue == defaultValue;
    }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }
    void ClearModifiedFlag() { m_modified = false; }

    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (m_optValue == value) { return true; }
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        m_modified = true;
        return true;
    }

    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (m_optValue == value) { return true; }
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        return true;
    }

    void ResetValue()
    {
        if (!m_optValue) { return; }
        m_optValue.reset();
        m_modified = true;
    }

protected:
    bool m_modified;
    std::optional<ValueType> m_optValue;
    Validator m_validator;
};

//----------------------------------------------------------------------------------------------------------------------

// An optional field whose value is stored in the file as a string and constructed from it (e.g. durations).
template<FieldNameTag NameTag, typename ValueType>
class OptionalConstructedField : public OptionalField<NameTag, ValueType>
{
public:
    using Validator = typename OptionalField<NameTag, ValueType>::Validator;
    using ConverterTo = std::function<std::optional<ValueType>(std::string_view serialized)>;
    using ConverterFrom = std::function<std::optional<std::string>(ValueType const& value)>;

    using OptionalField<NameTag, ValueType>::DefaultValidator;
    using OptionalField<NameTag, ValueType>::SetValueFromConfig;
    using OptionalField<NameTag, ValueType>::m_optValue;
    using OptionalField<NameTag, ValueType>::m_validator;

    OptionalConstructedField(
        ConverterTo const& converterTo, ConverterFrom const& converterFrom, Validator const& validator = DefaultValidator)
        : OptionalField<NameTag, ValueType>(validator)
        , m_convertTo(converterTo)
        , m_convertFrom(converterFrom)
    {
    }

    [[nodiscard]] bool operator==(OptionalConstructedField const& other) const noexcept
    {
        return m_optValue == other.m_optValue;
    }

    [[nodiscard]] std::optional<std::string> GetSerializedValue() const
    {
        if (!m_optValue) { return {}; }
        return m_convertFrom(*m_optValue);
    }

    [[nodiscard]] bool SetValueFromConfig(std::string_view serialized)
    {
        auto const optValue = m_convertTo(serialized);
        if (!optValue || !m_validator(*optValue)) { return false; }
        m_optValue = *optValue;
        return true;
    }

private:
    ConverterTo m_convertTo;
    ConverterFrom m_convertFrom;
};

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
