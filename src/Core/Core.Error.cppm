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
    // 1. std::expected<T, E> - fallible operations the caller must handle
    //                          (evaluation, resource store mutations).
    //                          Subsystems with a richer vocabulary define their
    //                          own enum (see Sync::SyncError).
    // 2. std::optional<T>    - queries where "not found" is a normal outcome
    //                          (name lookups, cache lookups, fingerprints of
    //                          unsupported objects).
    // 3. Raw pointers (T*)   - non-owning observation only; nullptr = absent.
    // 4. Assertions          - invariants. A violation is a bug, not input.
    //
    // No exceptions cross subsystem boundaries.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        ResourceNotFound = 100,
        ResourceBusy = 101,

        // Validation errors (300-399)
        InvalidState = 301,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:          return "Success";
            case ErrorCode::ResourceNotFound: return "ResourceNotFound";
            case ErrorCode::ResourceBusy:     return "ResourceBusy";
            case ErrorCode::InvalidState:     return "InvalidState";
            default:                          return "Unknown";
        }
    }

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
