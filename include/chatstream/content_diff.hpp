#pragma once

#include <cstddef>
#include <optional>
#include <set>

#include "chatstream/content_segment.hpp"

namespace chatstream {

enum class ChangeType { NoChange, AppendToLastSegment, SegmentUpdate, FullUpdate };

const char* to_string(ChangeType type);

struct ContentDiff {
  ChangeType change_type = ChangeType::FullUpdate;
  /// Segment index for AppendToLastSegment and SegmentUpdate.
  std::optional<std::size_t> index;
  std::set<std::size_t> affected_segments;
};

/// True when `updated` extends `current` in place: same kind, the new text
/// starts with the old text and, for code, the language is unchanged.
bool can_incrementally_update(const ContentSegment& current, const ContentSegment& updated);

/**
 * Classifies the cheapest rendering update from `previous` to `next`.
 * The first matching rule wins: no change, append to the last segment,
 * replace a single segment, full update.
 */
ContentDiff diff_content(const MessageContent& previous, const MessageContent& next);

}  // namespace chatstream
