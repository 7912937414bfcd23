#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int BROWSER_LAUNCH_FAILED = 5023;  // Browser could not be opened
}  // namespace GENERAL

namespace CONFIG {  // Configuration errors

constexpr int MISSING_CLIENT_ID = 5300;  // Client id is empty
constexpr int MISSING_REDIRECT_URL = 5301;  // Redirect URL is empty
constexpr int UNREADABLE = 5302;  // Credentials file unreadable or malformed
}  // namespace CONFIG

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int SSL_ERROR = 5204;  // SSL error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int LISTEN_FAILED = 5206;  // Local listener could not bind
constexpr int HTTP_STATUS = 5207;  // Non-2xx HTTP status
}  // namespace NETWORK

namespace PKCE {  // PKCE errors

constexpr int INVALID_LENGTH = 6100;  // Verifier length outside [43, 128]
constexpr int EMPTY_INPUT = 6101;  // Empty verifier
constexpr int RANDOM_FAILURE = 6102;  // Secure random source failed
}  // namespace PKCE

namespace OAUTH {  // OAuth flow errors

constexpr int WAIT_TIMEOUT = 6200;  // Redirect not received in time
}  // namespace OAUTH

namespace TCX {  // TCX document errors

constexpr int PARSE_FAILED = 6300;  // Document is not well-formed XML
constexpr int MISSING_ELEMENT = 6301;  // Required element absent
constexpr int TIMESTAMP_PARSE_ERROR = 6302;  // Timestamp is not RFC 3339
constexpr int SERIALIZE_FAILED = 6303;  // Document could not be written out
}  // namespace TCX

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
}  // namespace JSON

}  // namespace my_errors
