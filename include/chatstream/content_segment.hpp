#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace chatstream {

enum class Role { User, Assistant, System };

const char* to_string(Role role);

/// Metadata of a file the user attached to a message.
struct AttachmentRef {
  std::string filename;
  std::string mime_type;
  std::size_t byte_size = 0;

  bool operator==(const AttachmentRef&) const = default;
};

struct TextSegment {
  std::string text;

  bool operator==(const TextSegment&) const = default;
};

struct CodeSegment {
  std::string code;
  std::string language;

  bool operator==(const CodeSegment&) const = default;
};

/// Text of a message that is still being generated and contains no fence.
struct StreamingTextSegment {
  std::string text;

  bool operator==(const StreamingTextSegment&) const = default;
};

/// A code block whose closing fence has not arrived yet. `raw` starts at the
/// opening fence.
struct PartialCodeSegment {
  std::string raw;
  std::string language;

  bool operator==(const PartialCodeSegment&) const = default;
};

struct AttachmentsSegment {
  std::vector<AttachmentRef> attachments;

  bool operator==(const AttachmentsSegment&) const = default;
};

struct GeneratedImagesSegment {
  std::vector<std::vector<std::uint8_t>> images;

  bool operator==(const GeneratedImagesSegment&) const = default;
};

using ContentSegment = std::variant<TextSegment,
                                    CodeSegment,
                                    StreamingTextSegment,
                                    PartialCodeSegment,
                                    AttachmentsSegment,
                                    GeneratedImagesSegment>;

/// Stable lowercase name of the segment kind ("text", "code", ...).
const char* segment_kind(const ContentSegment& segment);

/**
 * Renderable form of one message. Recomputed from the full text on every
 * snapshot and compared with ContentDiffEngine rather than mutated in place.
 */
struct MessageContent {
  std::vector<ContentSegment> segments;
  bool is_streaming = false;
  std::string message_id;
  Role role = Role::Assistant;

  /// True when nothing visible would be rendered: no segments, or only
  /// whitespace text/code and empty attachment or image lists.
  bool is_empty() const;

  bool operator==(const MessageContent&) const = default;
};

}  // namespace chatstream
