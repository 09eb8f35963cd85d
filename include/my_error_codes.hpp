#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int INVALID_ENTITY = 5001;  // Invalid entity
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_PARAM = 5004;  // Missing parameter
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int TYPE_CONVERT_FAILED = 5009;  // Type conversion failed
constexpr int NOT_IMPLEMENTED = 5010;  // Not implemented
constexpr int CREATE_FAILED = 5014;  // Create failed
constexpr int UPDATE_FAILED = 5015;  // Update failed
constexpr int DELETE_FAILED = 5016;  // Delete failed
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int RESOLVE_ERROR = 5206;  // Name resolution error
constexpr int BAD_STATUS = 5207;  // Unexpected HTTP status
}  // namespace NETWORK

namespace OPENSSL {  // OPENSSL errors

constexpr int UNEXPECTED_RESULT = 8000;  // Unexpected result
constexpr int INVALID_KEY = 8001;  // Invalid key
}  // namespace OPENSSL

namespace REMOTE_SHELL {  // Remote shell errors

constexpr int CONNECT_FAILED = 9100;  // Could not reach the device
constexpr int EXEC_FAILED = 9101;  // Remote command exited non-zero
constexpr int TIMEOUT = 9102;  // Remote command timed out
constexpr int UPLOAD_FAILED = 9103;  // Upload to the device failed
constexpr int SPAWN_FAILED = 9104;  // Local ssh client could not start
}  // namespace REMOTE_SHELL

namespace MIGRATION {  // Migration errors

constexpr int PREFLIGHT_FAILED = 9200;  // Cannot gain write access
constexpr int DNS_PREFLIGHT_FAILED = 9201;  // DNS redirection not ready
constexpr int BACKUP_MISSING = 9202;  // No on-device original to restore
constexpr int BACKUP_EXISTS = 9203;  // On-device original already present
constexpr int INVALID_TARGET = 9204;  // Target URL/hostname unusable
constexpr int STRATEGY_FAILED = 9205;  // Strategy step failed
constexpr int SELF_TEST_FAILED = 9206;  // Connectivity self-test failed
constexpr int UNKNOWN_METHOD = 9207;  // Unknown migration method
constexpr int CONFIG_ENCODE = 9208;  // Planned config could not be serialized
constexpr int REMOTE_SERVICES = 9209;  // Remote services marker not changed
}  // namespace MIGRATION

namespace TRUST_STORE {  // Trust store errors

constexpr int READ_FAILED = 9300;  // Trust bundle unreadable
constexpr int WRITE_FAILED = 9301;  // Trust bundle upload failed
constexpr int CA_UNAVAILABLE = 9302;  // CA certificate not available
}  // namespace TRUST_STORE

}  // namespace my_errors
