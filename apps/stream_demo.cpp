#include "chatstream/client.hpp"
#include "chatstream/content_diff.hpp"
#include "chatstream/content_parser.hpp"
#include "chatstream/error.hpp"
#include "chatstream/request.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

void print_segments(const chatstream::MessageContent& content)
{
  for (const auto& segment : content.segments)
  {
    std::cout << "  [" << chatstream::segment_kind(segment) << "]";
    if (const auto* code = std::get_if<chatstream::CodeSegment>(&segment))
    {
      std::cout << " " << (code->language.empty() ? "plain" : code->language) << ", " << code->code.size()
                << " bytes";
    }
    else if (const auto* images = std::get_if<chatstream::GeneratedImagesSegment>(&segment))
    {
      std::cout << " " << images->images.size() << " image(s)";
    }
    std::cout << '\n';
  }
}

}  // namespace

int main()
{
  try
  {
    // API key, base URL and log level come from the environment.
    chatstream::ResponseStreamClient client(chatstream::ClientOptions{});

    std::cout << "Interactive streaming chat demo\n"
              << "Type 'exit' or 'quit' to stop.\n";

    chatstream::ConversationContext context;
    std::vector<chatstream::ConversationTurn> history;
    int turn = 0;

    for (;;)
    {
      std::cout << "\nYou> " << std::flush;
      std::string user_input;

      if (!std::getline(std::cin, user_input))
      {
        std::cout << "\nEnd of input, exiting.\n";
        break;
      }

      if (user_input == "exit" || user_input == "quit")
      {
        std::cout << "Goodbye!\n";
        break;
      }

      if (user_input.empty())
      {
        continue;
      }

      auto input = chatstream::build_conversation_input(history, chatstream::make_user_message(user_input));
      auto request = chatstream::make_stream_request("gpt-4o-mini", std::move(input));

      const std::string message_id = "assistant-" + std::to_string(++turn);
      std::string running_text;
      std::optional<chatstream::GeneratedImages> images;
      bool streaming = true;
      chatstream::MessageContent rendered;
      std::map<chatstream::ChangeType, int> changes;

      std::cout << "Assistant> " << std::flush;

      auto result = client.stream(
          request,
          context,
          [&](const chatstream::StreamUpdate& update)
          {
            std::visit(
                [&](const auto& u)
                {
                  using T = std::decay_t<decltype(u)>;
                  if constexpr (std::is_same_v<T, chatstream::DeltaUpdate>)
                  {
                    running_text += u.text;
                    std::cout << u.text << std::flush;
                  }
                  else if constexpr (std::is_same_v<T, chatstream::SnapshotUpdate>)
                  {
                    running_text = u.text;
                  }
                  else if constexpr (std::is_same_v<T, chatstream::CompletedUpdate>)
                  {
                    running_text = u.text;
                    streaming = false;
                    if (!u.generated_images.empty())
                    {
                      images = u.generated_images;
                    }
                  }
                  else if constexpr (std::is_same_v<T, chatstream::FailedUpdate>)
                  {
                    streaming = false;
                    std::cerr << "\n[stream error] " << u.message << std::endl;
                  }
                  else if constexpr (std::is_same_v<T, chatstream::CancelledUpdate>)
                  {
                    streaming = false;
                  }
                },
                update);

            auto next = chatstream::make_message_content(
                running_text, message_id, chatstream::Role::Assistant, streaming, {}, images);
            ++changes[chatstream::diff_content(rendered, next).change_type];
            rendered = std::move(next);
          });

      std::cout << std::endl;

      if (result.state.status != chatstream::ResponseStatus::Completed)
      {
        std::cout << "Response ended as " << chatstream::to_string(result.state.status)
                  << ". Please try again." << std::endl;
        continue;
      }

      std::cout << "Segments:\n";
      print_segments(rendered);
      std::cout << "Re-renders:";
      for (const auto& [type, count] : changes)
      {
        std::cout << " " << chatstream::to_string(type) << "=" << count;
      }
      std::cout << '\n';

      history.push_back({chatstream::Role::User, user_input, false});
      history.push_back({chatstream::Role::Assistant, result.final_text.value_or(running_text), false});
    }
  }
  catch (const chatstream::ChatStreamError& error)
  {
    std::cerr << "chatstream error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
