#include "chatstream/content_diff.hpp"

#include <string_view>
#include <type_traits>

namespace chatstream {

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

}  // namespace

const char* to_string(ChangeType type) {
  switch (type) {
    case ChangeType::NoChange:
      return "no_change";
    case ChangeType::AppendToLastSegment:
      return "append_to_last_segment";
    case ChangeType::SegmentUpdate:
      return "segment_update";
    case ChangeType::FullUpdate:
      return "full_update";
  }
  return "full_update";
}

bool can_incrementally_update(const ContentSegment& current, const ContentSegment& updated) {
  if (current.index() != updated.index()) {
    return false;
  }
  return std::visit(
      [&](const auto& old_value) {
        using T = std::decay_t<decltype(old_value)>;
        const auto& new_value = std::get<T>(updated);
        if constexpr (std::is_same_v<T, TextSegment> || std::is_same_v<T, StreamingTextSegment>) {
          return starts_with(new_value.text, old_value.text);
        } else if constexpr (std::is_same_v<T, CodeSegment>) {
          return old_value.language == new_value.language && starts_with(new_value.code, old_value.code);
        } else if constexpr (std::is_same_v<T, PartialCodeSegment>) {
          return old_value.language == new_value.language && starts_with(new_value.raw, old_value.raw);
        } else {
          return false;
        }
      },
      current);
}

ContentDiff diff_content(const MessageContent& previous, const MessageContent& next) {
  if (previous == next) {
    return ContentDiff{.change_type = ChangeType::NoChange, .index = std::nullopt, .affected_segments = {}};
  }

  const auto& old_segments = previous.segments;
  const auto& new_segments = next.segments;
  if (old_segments.size() == new_segments.size() && !old_segments.empty()) {
    const auto last = old_segments.size() - 1;

    bool prefix_equal = true;
    for (std::size_t i = 0; i < last; ++i) {
      if (!(old_segments[i] == new_segments[i])) {
        prefix_equal = false;
        break;
      }
    }
    if (prefix_equal && can_incrementally_update(old_segments[last], new_segments[last])) {
      return ContentDiff{.change_type = ChangeType::AppendToLastSegment, .index = last, .affected_segments = {last}};
    }

    std::set<std::size_t> changed;
    for (std::size_t i = 0; i < old_segments.size(); ++i) {
      if (!(old_segments[i] == new_segments[i])) {
        changed.insert(i);
      }
    }
    if (changed.size() == 1) {
      const auto index = *changed.begin();
      return ContentDiff{.change_type = ChangeType::SegmentUpdate, .index = index, .affected_segments = changed};
    }
  }

  ContentDiff diff{.change_type = ChangeType::FullUpdate, .index = std::nullopt, .affected_segments = {}};
  for (std::size_t i = 0; i < new_segments.size(); ++i) {
    diff.affected_segments.insert(i);
  }
  return diff;
}

}  // namespace chatstream
