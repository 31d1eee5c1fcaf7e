/**
 * @file content_sniffer.h
 * @brief MIME type detection from leading bytes
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_CONTENT_SNIFFER_H
#define PIPEDREAM_CORE_CONTENT_SNIFFER_H

#include <cstddef>
#include <span>
#include <string>

namespace pipedream {

/**
 * @brief Number of leading bytes considered by detect_content_type()
 */
inline constexpr std::size_t sniff_length = 512;

/**
 * @brief Infer a MIME type from the first bytes of an object
 *
 * Follows the WHATWG MIME sniffing rules for common HTML, XML, document,
 * image, audio/video and archive signatures. Data without binary control
 * bytes is reported as "text/plain; charset=utf-8"; anything else falls
 * back to "application/octet-stream".
 */
[[nodiscard]] auto detect_content_type(std::span<const std::byte> data) -> std::string;

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_CONTENT_SNIFFER_H
