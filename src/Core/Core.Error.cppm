module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations the caller MUST handle:
    //                          - Placeholder exhaustion on mesh overwrite
    //                          - Patches against a mesh that was never built
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome:
    //                          - Progress of a job that already finished
    //                          - Offset or layout of a mesh not yet published
    //
    // 3. Assertions          - For caller-contract violations (slot index out
    //                          of range, wrong bucket type, layout mismatch).
    //                          Release builds additionally return an error code
    //                          so memory is never touched out of bounds.
    //
    // Cancellation of a superseded regeneration is never surfaced as an
    // error; it is recovered inside the store.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceExhausted = 101,
        ResourceBusy = 102,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        OutOfRange = 303,
        TypeMismatch = 304,
        LayoutMismatch = 305,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:            return "Success";
            case ErrorCode::OutOfMemory:        return "OutOfMemory";
            case ErrorCode::ResourceExhausted:  return "ResourceExhausted";
            case ErrorCode::ResourceBusy:       return "ResourceBusy";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::InvalidState:       return "InvalidState";
            case ErrorCode::OutOfRange:         return "OutOfRange";
            case ErrorCode::TypeMismatch:       return "TypeMismatch";
            case ErrorCode::LayoutMismatch:     return "LayoutMismatch";
            default:                            return "Unknown";
        }
    }

    template <typename T>
    using Expected = std::expected<T, ErrorCode>;

    template <typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template <typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
