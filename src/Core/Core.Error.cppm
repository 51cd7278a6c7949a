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
    // 1. Core::Expected<T>  - For FALLIBLE operations. Builders, content writes,
    //                         backend allocations and frame execution all
    //                         report through this; callers MUST inspect it.
    //
    // 2. std::optional<T>   - For optional configuration (clear colours,
    //                         depth ops, index buffers) where "unset" is a
    //                         valid state, not a failure.
    //
    // 3. Raw pointers (T*)  - ONLY for non-owning observation of objects owned
    //                         by a registry or by the device.
    //
    // Construction-time misuse (unset mandatory field, foreign handle, wrong
    // element type) is reported as an error code and logged at Error level.
    // It is a programmer error: the caller should not retry it.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        FileWriteError = 202,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,
        TypeMismatch = 304,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        SurfaceLost = 404,

        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::OutOfMemory:             return "OutOfMemory";
            case ErrorCode::ResourceNotFound:        return "ResourceNotFound";
            case ErrorCode::FileNotFound:            return "FileNotFound";
            case ErrorCode::FileReadError:           return "FileReadError";
            case ErrorCode::FileWriteError:          return "FileWriteError";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::InvalidFormat:           return "InvalidFormat";
            case ErrorCode::OutOfRange:              return "OutOfRange";
            case ErrorCode::TypeMismatch:            return "TypeMismatch";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:       return "OutOfDeviceMemory";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::SurfaceLost:             return "SurfaceLost";
            default:                                 return "Unknown";
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
    inline constexpr Unit unit{};

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
