//----------------------------------------------------------------------------------------------------------------------
// File: StatusCode.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t { Success, DecodeError, InputError, FileError };

using DeserializationResult = std::pair<StatusCode, std::string>;
using SerializationResult = std::pair<StatusCode, std::string>;
using ValidationResult = std::pair<StatusCode, std::string>;

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result += std::string(result.empty() ? "" : ".").append(fields)), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field was not found.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format("The '{}' field must be of type {}.", ConcatenateFieldNames(fields...), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. See documentation for supported values.",
        ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateValueRangeMessage(
    std::integral auto min, std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be a value between '{}' and '{}'.", ConcatenateFieldNames(fields...), min, max);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededCharacterLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field exceeds the maximum allowed length of '{}' characters.",
        ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
