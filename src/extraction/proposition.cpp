#include <cairn/extraction/proposition.h>

#include <spdlog/spdlog.h>

#include <cctype>

namespace cairn::extraction {

namespace {

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::string preview(std::string_view raw) {
    constexpr std::size_t kMax = 200;
    if (raw.size() <= kMax)
        return std::string(raw);
    return std::string(raw.substr(0, kMax)) + "...";
}

Error invalid(std::size_t index, const std::string& why) {
    return Error{ErrorCode::ExtractionError,
                 "Proposition " + std::to_string(index) + " " + why};
}

Result<Proposition> parseOne(std::size_t index, const nlohmann::json& item) {
    if (!item.is_object())
        return invalid(index, "is not an object");

    Proposition p;

    auto text = item.find("proposition");
    if (text == item.end())
        return invalid(index, "missing required field: proposition");
    if (!text->is_string())
        return invalid(index, "field 'proposition' must be a string");
    p.text = std::string(trimView(text->get_ref<const std::string&>()));
    if (p.text.empty())
        return invalid(index, "has empty proposition text");

    // Older prompts used node_type for the same field
    auto purpose = item.find("node_purpose");
    if (purpose == item.end())
        purpose = item.find("node_type");
    if (purpose == item.end())
        return invalid(index, "missing required field: node_purpose");
    if (!purpose->is_string())
        return invalid(index, "field 'node_purpose' must be a string");
    p.purpose = metadata::coercePurpose(purpose->get_ref<const std::string&>());

    auto confidence = item.find("confidence");
    if (confidence == item.end())
        return invalid(index, "missing required field: confidence");
    if (!confidence->is_number())
        return invalid(index, "field 'confidence' must be a number");
    p.confidence = confidence->get<double>();
    if (p.confidence < 0.0 || p.confidence > 1.0) {
        return invalid(index, fmt::format("confidence must be 0.0-1.0, got {}", p.confidence));
    }

    auto sourceType = item.find("source_type");
    if (sourceType == item.end())
        return invalid(index, "missing required field: source_type");
    if (!sourceType->is_string())
        return invalid(index, "field 'source_type' must be a string");
    auto parsedSource = metadata::parseSourceType(sourceType->get_ref<const std::string&>());
    if (!parsedSource) {
        return invalid(index, "has unknown source_type '" +
                                  sourceType->get_ref<const std::string&>() + "'");
    }
    p.sourceType = *parsedSource;

    if (auto data = item.find("structured_data"); data != item.end() && !data->is_null()) {
        if (!data->is_object())
            return invalid(index, "field 'structured_data' must be an object or null");
        p.structuredData = *data;
    }
    return p;
}

} // namespace

Result<void> validateProposition(const Proposition& p, std::size_t index) {
    if (trimView(p.text).empty())
        return invalid(index, "has empty proposition text");
    if (!(p.confidence >= 0.0 && p.confidence <= 1.0))
        return invalid(index, fmt::format("confidence must be 0.0-1.0, got {}", p.confidence));
    if (!p.structuredData.is_null() && !p.structuredData.is_object())
        return invalid(index, "field 'structured_data' must be an object or null");
    return {};
}

std::string stripCodeFence(std::string_view raw) {
    std::string_view s = trimView(raw);
    if (s.size() < 6 || s.substr(0, 3) != "```" || s.substr(s.size() - 3) != "```")
        return std::string(s);

    auto firstNewline = s.find('\n');
    if (firstNewline == std::string_view::npos)
        return std::string(s);
    s = s.substr(firstNewline + 1);
    s.remove_suffix(3);
    return std::string(trimView(s));
}

Result<std::vector<Proposition>> parseExtractionResponse(std::string_view raw) {
    const std::string body = stripCodeFence(raw);
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return Error{ErrorCode::ExtractionError, "Model returned invalid JSON: " + preview(raw)};
    }
    if (!json.is_object()) {
        return Error{ErrorCode::ExtractionError,
                     "Model response must be a JSON object: " + preview(raw)};
    }

    auto list = json.find("propositions");
    if (list == json.end()) {
        return Error{ErrorCode::ExtractionError,
                     "Response missing 'propositions' key: " + preview(raw)};
    }
    if (!list->is_array()) {
        return Error{ErrorCode::ExtractionError,
                     std::string("'propositions' must be a list, got ") + list->type_name()};
    }

    std::vector<Proposition> out;
    out.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        auto p = parseOne(i, (*list)[i]);
        if (!p)
            return p.error();
        out.push_back(std::move(p).value());
    }
    spdlog::debug("Parsed {} propositions from model response", out.size());
    return out;
}

nlohmann::json toJson(const Proposition& p) {
    return {{"proposition", p.text},
            {"node_purpose", metadata::toString(p.purpose)},
            {"confidence", p.confidence},
            {"source_type", metadata::toString(p.sourceType)},
            {"structured_data", p.structuredData}};
}

} // namespace cairn::extraction
