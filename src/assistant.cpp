#include "assist/assistant.hpp"

#include "assist/error.hpp"

#include <exception>
#include <utility>

namespace assist {
namespace {

// Drops the insertion anchor once the exchange is over, whatever the outcome.
class AnchorLease {
public:
  AnchorLease(Document& document, Anchor anchor) : document_(document), anchor_(anchor) {}
  ~AnchorLease() {
    document_.update([this](Buffer& buffer) { buffer.release(anchor_); });
  }

  AnchorLease(const AnchorLease&) = delete;
  AnchorLease& operator=(const AnchorLease&) = delete;

private:
  Document& document_;
  Anchor anchor_;
};

}  // namespace

const char* to_string(AssistStatus status) {
  switch (status) {
    case AssistStatus::Completed:
      return "completed";
    case AssistStatus::Skipped:
      return "skipped";
    case AssistStatus::Failed:
      return "failed";
  }
  return "failed";
}

Assistant::Assistant(AssistOptions options,
                     std::unique_ptr<HttpClient> http_client,
                     std::shared_ptr<Executor> executor)
    : options_(std::move(options)),
      logger_(options_.logger, options_.log_level) {
  validate_options(options_);
  if (!options_.api_key.empty()) {
    client_ = std::make_unique<CompletionClient>(options_, std::move(http_client), std::move(executor));
  }
}

AssistOutcome Assistant::run(Document& document, const std::vector<SelectionRange>& selections) {
  if (!client_) {
    throw ConfigurationError("Missing API key. Provide AssistOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }

  FramedPrompt framed = frame_selections(document, selections);
  AnchorLease lease(document, framed.insertion_site);

  ChatRequest request;
  request.model = options_.model;
  request.messages.emplace_back(ChatRole::System, options_.system_prompt);
  request.messages.emplace_back(ChatRole::User, framed.text);

  auto channel = client_->stream_completion(std::move(request));

  InsertionSink sink(document, framed.insertion_site, logger_);
  AssistOutcome outcome;
  outcome.report = sink.drain(*channel);
  outcome.prompt = std::move(framed.text);
  return outcome;
}

AssistStatus Assistant::invoke(Document& document, const std::vector<SelectionRange>& selections) {
  if (!client_) {
    logger_.log(LogLevel::Debug, "no API key configured, assist skipped");
    return AssistStatus::Skipped;
  }

  try {
    AssistOutcome outcome = run(document, selections);
    if (outcome.report.transport_error) {
      // The sink already reported the interruption.
      return AssistStatus::Failed;
    }
    logger_.log(LogLevel::Info, "assist completed",
                {{"insertions", outcome.report.insertions},
                 {"inserted_bytes", outcome.report.inserted_bytes},
                 {"decode_errors", outcome.report.decode_errors}});
    return AssistStatus::Completed;
  } catch (const ServiceError& error) {
    logger_.log(LogLevel::Error, "assist failed",
                {{"status", error.status_code()}, {"body", error.body()}, {"error", error.what()}});
  } catch (const AssistError& error) {
    logger_.log(LogLevel::Error, "assist failed", {{"error", error.what()}});
  } catch (const std::exception& error) {
    // Thread start failures, broken promises from a misbehaving executor, allocation failures.
    logger_.log(LogLevel::Error, "assist failed", {{"error", error.what()}});
  }
  return AssistStatus::Failed;
}

}  // namespace assist
