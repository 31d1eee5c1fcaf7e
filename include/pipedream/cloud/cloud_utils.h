/**
 * @file cloud_utils.h
 * @brief Encoding, hashing and XML helpers for the S3 backend
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CLOUD_CLOUD_UTILS_H
#define PIPEDREAM_CLOUD_CLOUD_UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pipedream::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to hexadecimal string
 * @param bytes Vector of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief SHA256 hash of a string
 * @return 32 hash bytes
 */
auto sha256(const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief SHA256 hash of bytes
 * @return 32 hash bytes
 */
auto sha256_bytes(std::span<const std::byte> data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256
 * @param key Key bytes
 * @param data Data to sign
 * @return 32 byte MAC
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 with string key
 */
auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a UTC time point as YYYYMMDD'T'HHMMSS'Z'
 */
auto format_iso8601_time(std::chrono::system_clock::time_point when) -> std::string;

/**
 * @brief Get current UTC time as ISO 8601 basic format (YYYYMMDD'T'HHMMSS'Z')
 */
auto get_iso8601_time() -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract XML element value
 * @param xml XML string to parse
 * @param tag Tag name to extract
 * @return Element value if found, nullopt otherwise
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Escape the five XML special characters
 */
auto xml_escape(const std::string& value) -> std::string;

}  // namespace pipedream::cloud_utils

#endif  // PIPEDREAM_CLOUD_CLOUD_UTILS_H
