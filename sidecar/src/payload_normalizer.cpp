#include "payload_normalizer.hpp"

#include "json_codec.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>

namespace sidecar::payload {

namespace {

// First of `keys` present with a non-null value, or null.
Json first_present(const Json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto value = codec::find_key(object, key)) {
            if (!value->is_null()) {
                return *value;
            }
        }
    }
    return nullptr;
}

void set_if_present(Json& out, const char* key, const Json& value) {
    if (!value.is_null()) {
        out[key] = value;
    }
}

bool is_qualifying_text_part(const Json& part) {
    if (!part.is_object()) {
        return false;
    }
    auto type = codec::find_key(part, "type");
    auto text = codec::find_key(part, "text");
    if (!type || codec::as_string(*type) != "text" || !text || !text->is_string()) {
        return false;
    }
    auto synthetic = codec::find_key(part, "synthetic");
    auto ignored = codec::find_key(part, "ignored");
    return !(synthetic && codec::is_truthy(*synthetic)) && !(ignored && codec::is_truthy(*ignored));
}

} // namespace

std::string extract_message_text(const Json& parts, const std::string& role) {
    if (!parts.is_array() || parts.empty()) {
        return "";
    }

    const Json* selected = nullptr;
    for (const auto& part : parts) {
        if (!is_qualifying_text_part(part)) {
            continue;
        }
        if (role == "assistant") {
            selected = &part;
            continue;
        }
        if (!selected || part["text"].get_ref<const std::string&>().size() >
                             (*selected)["text"].get_ref<const std::string&>().size()) {
            selected = &part;
        }
    }

    if (!selected) {
        return "";
    }
    return (*selected)["text"].get<std::string>();
}

UiProviders to_ui_providers(const Json& raw) {
    UiProviders result;

    if (auto providers = codec::find_key(raw, "providers")) {
        if (providers->is_array()) {
            for (const auto& provider : *providers) {
                std::string id = codec::as_string(first_present(provider, {"id"}));
                std::string name = codec::as_string(first_present(provider, {"name"}));

                UiProvider ui;
                ui.name = name.empty() ? id : name;
                if (auto models = codec::find_key(provider, "models")) {
                    if (models->is_object()) {
                        for (const auto& entry : models->items()) {
                            ui.models.push_back(id + "/" + entry.key());
                        }
                    }
                }
                result.providers.push_back(std::move(ui));
            }
        }
    }

    if (auto defaults = codec::find_key(raw, "default")) {
        if (defaults->is_object()) {
            for (const auto& entry : defaults->items()) {
                std::string model_id = entry.value().is_string() ? entry.value().get<std::string>()
                                                                 : entry.value().dump();
                result.defaults.emplace_back(entry.key(), entry.key() + "/" + model_id);
            }
        }
    }

    return result;
}

Json to_json(const UiProviders& providers) {
    Json list = Json::array();
    for (const auto& provider : providers.providers) {
        list.push_back(Json{{"name", provider.name}, {"models", provider.models}});
    }

    Json defaults = Json::object();
    for (const auto& entry : providers.defaults) {
        defaults[entry.first] = entry.second;
    }

    return {{"providers", std::move(list)}, {"defaults", std::move(defaults)}};
}

Json normalize_prompt_parts(const Json& parts, const std::string& message) {
    Json normalized = parts.is_array() ? parts : Json::array();

    bool has_typed = false;
    bool has_text = false;
    for (const auto& part : normalized) {
        if (part.is_object() && part.contains("type")) {
            has_typed = true;
            if (codec::as_string(part["type"]) == "text") {
                has_text = true;
            }
        }
    }

    if (!has_typed) {
        normalized = Json::array();
    }
    if (!has_text) {
        normalized.insert(normalized.begin(), Json{{"type", "text"}, {"text", message}});
    }
    return normalized;
}

std::optional<ModelRef> split_model(const std::string& model) {
    auto slash = model.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return ModelRef{model.substr(0, slash), model.substr(slash + 1)};
}

Json summarize_session(const Json& session) {
    Json out = Json::object();
    set_if_present(out, "path", first_present(session, {"path", "id", "slug"}));
    set_if_present(out, "name", first_present(session, {"name", "title"}));
    set_if_present(out, "model", first_present(session, {"model"}));
    if (auto time = codec::find_key(session, "time")) {
        set_if_present(out, "created", first_present(*time, {"created"}));
    }
    return out;
}

Json summarize_sessions(const Json& sessions) {
    Json list = Json::array();
    if (sessions.is_array()) {
        for (const auto& session : sessions) {
            list.push_back(summarize_session(session));
        }
    }
    return list;
}

Json summarize_provider_list(const Json& raw) {
    Json all = Json::array();
    if (auto providers = codec::find_key(raw, "all")) {
        if (providers->is_array()) {
            for (const auto& provider : *providers) {
                Json entry = Json::object();
                Json id = first_present(provider, {"id"});
                entry["id"] = id;
                Json name = first_present(provider, {"name"});
                entry["name"] = name.is_null() ? id : name;
                Json env = first_present(provider, {"env"});
                entry["env"] = env.is_null() ? Json::array() : env;
                set_if_present(entry, "source", first_present(provider, {"source"}));

                size_t model_count = 0;
                if (auto models = codec::find_key(provider, "models")) {
                    if (models->is_object()) {
                        model_count = models->size();
                    }
                }
                entry["modelCount"] = model_count;
                all.push_back(std::move(entry));
            }
        }
    }

    Json defaults = first_present(raw, {"default"});
    Json connected = first_present(raw, {"connected"});

    return {
        {"all", std::move(all)},
        {"default", defaults.is_null() ? Json::object() : defaults},
        {"connected", connected.is_null() ? Json::array() : connected},
    };
}

Json summarize_messages(const Json& raw) {
    Json list = Json::array();
    if (!raw.is_array()) {
        return list;
    }

    for (const auto& message : raw) {
        const Json info = first_present(message, {"info"});
        const std::string role = codec::as_string(first_present(info, {"role"}));

        std::string timestamp;
        Json created = nullptr;
        if (auto time = codec::find_key(info, "time")) {
            created = first_present(*time, {"created"});
        }
        if (created.is_number() && codec::as_double(created) != 0.0) {
            timestamp = format_iso_millis(codec::as_int64(created));
        } else {
            timestamp = now_iso();
        }

        Json entry = Json::object();
        entry["id"] = first_present(info, {"id"});
        entry["role"] = first_present(info, {"role"});
        entry["timestamp"] = timestamp;
        entry["text"] = extract_message_text(first_present(message, {"parts"}), role);
        list.push_back(std::move(entry));
    }
    return list;
}

std::string format_iso_millis(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    int millis = static_cast<int>(epoch_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[40] = {0};
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, millis);
    return out;
}

int64_t now_epoch_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string now_iso() {
    return format_iso_millis(now_epoch_ms());
}

} // namespace sidecar::payload
