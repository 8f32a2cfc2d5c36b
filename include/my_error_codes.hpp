#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_ERROR = 5204;  // SSL error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int RESOLVE_ERROR = 5206;  // Host name resolution error
constexpr int HTTP_STATUS = 5207;  // Non-success HTTP status
}  // namespace NETWORK

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
}  // namespace JSON

namespace IDENTITY {  // Client identity errors

constexpr int DIRECTORY_RESOLUTION = 6100;  // Data directory cannot be resolved
constexpr int DIRECTORY_CREATION = 6101;  // Data directory cannot be created
constexpr int FILE_WRITE = 6102;  // Identifier file cannot be written
}  // namespace IDENTITY

}  // namespace my_errors
