// Auto-generated from error_codes.ini
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int CANCELLED = 5206;  // Operation cancelled by caller
}  // namespace NETWORK

namespace SSH {  // SSH tunnel errors

constexpr int NO_CREDENTIAL = 5300;  // No usable credential configured
constexpr int AUTH_FAILED = 5301;  // Authentication rejected
constexpr int KEY_PARSE_FAILED = 5302;  // Private key could not be parsed
constexpr int HANDSHAKE_FAILED = 5303;  // SSH handshake failed
constexpr int HOST_KEY_MISMATCH = 5304;  // Host key fingerprint mismatch
constexpr int BIND_FAILED = 5305;  // Local listener bind failed
constexpr int CHANNEL_OPEN_FAILED = 5306;  // direct-tcpip channel open failed
constexpr int SESSION_CLOSED = 5307;  // Session already closed
}  // namespace SSH

namespace PROMETHEUS {  // Prometheus proxy errors

constexpr int GATEWAY_ERROR = 5400;  // HTTP round trip through tunnel failed
constexpr int REMOTE_REJECTED = 5401;  // Remote returned a non-success envelope
constexpr int BAD_STATUS = 5402;  // Remote returned a non-2xx status
constexpr int MALFORMED_RESPONSE = 5403;  // Response body is not valid JSON
constexpr int BAD_QUERY = 5404;  // Query could not be parsed
constexpr int BAD_RESOURCE_PATH = 5405;  // Resource path is malformed
}  // namespace PROMETHEUS

namespace JSON {  // Json errors

constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
}  // namespace JSON

namespace OPENSSL {  // OPENSSL errors

constexpr int INVALID_KEY = 8001;  // Invalid key
constexpr int INVALID_CERT = 8003;  // Invalid certificate
}  // namespace OPENSSL

}  // namespace my_errors
