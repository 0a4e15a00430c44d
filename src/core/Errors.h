#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 编排层统一的错误类型
 *
 * 名称同时用作 JSON 输出中的 "kind" 字段,不要随意改动。
 */
enum class ErrorKind {
    None,
    ConnectionError,      // transport unreachable or dropped
    AuthError,            // missing or rejected api key
    EndpointUnavailable,  // endpoint marked failed
    UnknownTool,
    InvalidArguments,
    DuplicateRequest,     // correlation id reused
    Timeout,
    RemoteError,          // business failure reported by the server
    Cancelled,
    HallucinatedTool,
    RoutingFailure,
    RegistryError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ConnectionError: return "connection_error";
        case ErrorKind::AuthError: return "auth_error";
        case ErrorKind::EndpointUnavailable: return "endpoint_unavailable";
        case ErrorKind::UnknownTool: return "unknown_tool";
        case ErrorKind::InvalidArguments: return "invalid_arguments";
        case ErrorKind::DuplicateRequest: return "duplicate_request";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::RemoteError: return "remote_error";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::HallucinatedTool: return "hallucinated_tool";
        case ErrorKind::RoutingFailure: return "routing_failure";
        case ErrorKind::RegistryError: return "registry_error";
    }
    return "unknown";
}

/**
 * @brief 传输层内部抛出的异常
 *
 * 只在 transport/ 与 registry 内部流动, Dispatcher 边界处转换为 DispatchResult。
 */
class TransportError : public std::runtime_error {
public:
    TransportError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};
