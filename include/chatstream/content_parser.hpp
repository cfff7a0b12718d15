#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatstream/content_segment.hpp"

namespace chatstream {

using GeneratedImages = std::vector<std::vector<std::uint8_t>>;

/**
 * Splits the full text of a message into text and fenced-code segments.
 *
 * The parser keeps no state between calls; callers pass the complete current
 * snapshot each time. While `is_streaming` is true an unterminated fence
 * becomes a trailing PartialCodeSegment and fence-free text becomes a
 * StreamingTextSegment. For finalized content an unterminated fence is kept
 * verbatim as text.
 *
 * A non-empty `attachments` list is emitted first; `generated_images`, when
 * present and non-empty, last.
 */
std::vector<ContentSegment> parse_content(std::string_view text,
                                          const std::vector<AttachmentRef>& attachments,
                                          const std::optional<GeneratedImages>& generated_images,
                                          bool is_streaming);

std::vector<ContentSegment> parse_content(std::string_view text, bool is_streaming = false);

MessageContent make_message_content(std::string_view text,
                                    std::string message_id,
                                    Role role,
                                    bool is_streaming,
                                    const std::vector<AttachmentRef>& attachments = {},
                                    const std::optional<GeneratedImages>& generated_images = std::nullopt);

}  // namespace chatstream
