#include "chatstream/content_parser.hpp"

#include <cctype>
#include <type_traits>
#include <utility>

namespace chatstream {

namespace {

constexpr std::string_view kFence = "```";

bool is_blank(std::string_view value) {
  for (char ch : value) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      return false;
    }
  }
  return true;
}

std::string trim(std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return std::string(input.substr(start, end - start));
}

void append_text(std::vector<ContentSegment>& segments, std::string_view region) {
  if (region.empty()) {
    return;
  }
  if (!segments.empty()) {
    if (auto* previous = std::get_if<TextSegment>(&segments.back())) {
      previous->text.append(region);
      return;
    }
  }
  segments.emplace_back(TextSegment{std::string(region)});
}

void parse_fenced(std::string_view text, bool is_streaming, std::vector<ContentSegment>& segments) {
  std::size_t cursor = 0;
  while (cursor < text.size()) {
    const auto open = text.find(kFence, cursor);
    if (open == std::string_view::npos) {
      append_text(segments, text.substr(cursor));
      return;
    }
    append_text(segments, text.substr(cursor, open - cursor));

    const auto after_fence = open + kFence.size();
    const auto newline = text.find('\n', after_fence);
    const auto inline_close = text.find(kFence, after_fence);

    // ```x``` on a single line: no language line, the whole span is code.
    if (inline_close != std::string_view::npos && (newline == std::string_view::npos || inline_close < newline)) {
      segments.emplace_back(CodeSegment{std::string(text.substr(after_fence, inline_close - after_fence)), ""});
      cursor = inline_close + kFence.size();
      continue;
    }

    std::string language;
    std::size_t close = std::string_view::npos;
    std::size_t body_start = text.size();
    if (newline == std::string_view::npos) {
      language = trim(text.substr(after_fence));
    } else {
      language = trim(text.substr(after_fence, newline - after_fence));
      body_start = newline + 1;
      close = text.find(kFence, body_start);
    }

    if (close == std::string_view::npos) {
      const auto raw = text.substr(open);
      if (is_streaming) {
        segments.emplace_back(PartialCodeSegment{std::string(raw), std::move(language)});
      } else {
        append_text(segments, raw);
      }
      return;
    }

    auto body = text.substr(body_start, close - body_start);
    if (!body.empty() && body.back() == '\n') {
      body.remove_suffix(1);
    }
    segments.emplace_back(CodeSegment{std::string(body), std::move(language)});
    cursor = close + kFence.size();
  }
}

}  // namespace

const char* to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::System:
      return "system";
  }
  return "assistant";
}

const char* segment_kind(const ContentSegment& segment) {
  return std::visit(
      [](const auto& value) -> const char* {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TextSegment>) {
          return "text";
        } else if constexpr (std::is_same_v<T, CodeSegment>) {
          return "code";
        } else if constexpr (std::is_same_v<T, StreamingTextSegment>) {
          return "streaming_text";
        } else if constexpr (std::is_same_v<T, PartialCodeSegment>) {
          return "partial_code";
        } else if constexpr (std::is_same_v<T, AttachmentsSegment>) {
          return "attachments";
        } else {
          return "generated_images";
        }
      },
      segment);
}

bool MessageContent::is_empty() const {
  for (const auto& segment : segments) {
    const bool empty = std::visit(
        [](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, TextSegment> || std::is_same_v<T, StreamingTextSegment>) {
            return is_blank(value.text);
          } else if constexpr (std::is_same_v<T, CodeSegment>) {
            return is_blank(value.code);
          } else if constexpr (std::is_same_v<T, PartialCodeSegment>) {
            return is_blank(value.raw);
          } else if constexpr (std::is_same_v<T, AttachmentsSegment>) {
            return value.attachments.empty();
          } else {
            return value.images.empty();
          }
        },
        segment);
    if (!empty) {
      return false;
    }
  }
  return true;
}

std::vector<ContentSegment> parse_content(std::string_view text,
                                          const std::vector<AttachmentRef>& attachments,
                                          const std::optional<GeneratedImages>& generated_images,
                                          bool is_streaming) {
  std::vector<ContentSegment> segments;
  if (!attachments.empty()) {
    segments.emplace_back(AttachmentsSegment{attachments});
  }

  if (!text.empty()) {
    if (text.find(kFence) == std::string_view::npos) {
      if (is_streaming) {
        segments.emplace_back(StreamingTextSegment{std::string(text)});
      } else {
        segments.emplace_back(TextSegment{std::string(text)});
      }
    } else {
      parse_fenced(text, is_streaming, segments);
    }
  }

  if (generated_images && !generated_images->empty()) {
    segments.emplace_back(GeneratedImagesSegment{*generated_images});
  }
  return segments;
}

std::vector<ContentSegment> parse_content(std::string_view text, bool is_streaming) {
  return parse_content(text, {}, std::nullopt, is_streaming);
}

MessageContent make_message_content(std::string_view text,
                                    std::string message_id,
                                    Role role,
                                    bool is_streaming,
                                    const std::vector<AttachmentRef>& attachments,
                                    const std::optional<GeneratedImages>& generated_images) {
  MessageContent content;
  content.segments = parse_content(text, attachments, generated_images, is_streaming);
  content.is_streaming = is_streaming;
  content.message_id = std::move(message_id);
  content.role = role;
  return content;
}

}  // namespace chatstream
