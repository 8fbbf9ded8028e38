module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations the caller MUST handle:
    //                          configuration validation, initialization,
    //                          typed subscription.
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome
    //                          (action name parsing, last device change).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing
    //                          objects where nullptr means "no reference"
    //                          (resolved bindings, the active map).
    //
    // Steady-state input processing never fails: degraded situations (no map
    // for a device, missing binding) are logged and absorbed.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Validation errors (300-399)
        InvalidArgument = 300,
        TypeMismatch = 304,

        // Input configuration errors (700-799)
        NoActionMaps = 700,
        DuplicateActionMap = 701,
        InvalidCategory = 702,
        BindingTypeMismatch = 703,

        // Lifecycle errors (800-899)
        AlreadyInitialized = 801,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::TypeMismatch:        return "TypeMismatch";
            case ErrorCode::NoActionMaps:        return "NoActionMaps";
            case ErrorCode::DuplicateActionMap:  return "DuplicateActionMap";
            case ErrorCode::InvalidCategory:     return "InvalidCategory";
            case ErrorCode::BindingTypeMismatch: return "BindingTypeMismatch";
            case ErrorCode::AlreadyInitialized:  return "AlreadyInitialized";
            default:                             return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
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
