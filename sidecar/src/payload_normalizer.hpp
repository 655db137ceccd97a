#pragma once

#include "protocol.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sidecar::payload {

struct UiProvider {
    std::string name;
    std::vector<std::string> models; // "providerID/modelID"
};

struct UiProviders {
    std::vector<UiProvider> providers;
    // providerID -> "providerID/modelID", in catalog order
    std::vector<std::pair<std::string, std::string>> defaults;
};

struct ModelRef {
    std::string provider_id;
    std::string model_id;
};

/**
 * Text of one conversational turn.
 *
 * Only parts with type "text", a string text and neither `synthetic` nor
 * `ignored` set are considered. For the "assistant" role the last such part
 * wins; for every other role the longest one does (first on ties).
 * Returns "" when nothing qualifies.
 */
std::string extract_message_text(const Json& parts, const std::string& role = "");

/// Flattens `{providers: [...], default: {...}}` from the provider catalog.
UiProviders to_ui_providers(const Json& raw);
Json to_json(const UiProviders& providers);

/// Guarantees the outgoing prompt carries at least one text part.
Json normalize_prompt_parts(const Json& parts, const std::string& message);

/// "openai/gpt-4/mini" -> {openai, gpt-4/mini}; nullopt without a '/'.
std::optional<ModelRef> split_model(const std::string& model);

Json summarize_session(const Json& session);
Json summarize_sessions(const Json& sessions);
Json summarize_provider_list(const Json& raw);
Json summarize_messages(const Json& raw);

/// ISO-8601 UTC with millisecond precision, e.g. 2026-01-31T16:51:25.637Z.
std::string format_iso_millis(int64_t epoch_ms);
std::string now_iso();
int64_t now_epoch_ms();

} // namespace sidecar::payload
