#pragma once

#include <cairn/core/types.h>
#include <cairn/metadata/graph_types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cairn::extraction {

/**
 * One atomic claim pulled out of a message.
 */
struct Proposition {
    std::string text;
    metadata::NodePurpose purpose = metadata::NodePurpose::Observation;
    double confidence = 1.0; // [0,1]
    metadata::SourceType sourceType = metadata::SourceType::Explicit;
    nlohmann::json structuredData; // null or object
};

/**
 * Validate a model response against the proposition schema:
 *
 *   {"propositions": [{"proposition", "node_purpose", "confidence", "source_type",
 *                      "structured_data"?}]}
 *
 * A surrounding ```json fence is tolerated. Unknown purposes are coerced to observation.
 * Everything else that does not fit is an ExtractionError naming the offending entry.
 */
Result<std::vector<Proposition>> parseExtractionResponse(std::string_view raw);

// Range and shape checks for a proposition built outside parseExtractionResponse.
// ExtractionError naming `index` on failure.
Result<void> validateProposition(const Proposition& p, std::size_t index);

// Removes a leading ``` / ```json line and the trailing ``` if both are present
std::string stripCodeFence(std::string_view raw);

nlohmann::json toJson(const Proposition& p);

} // namespace cairn::extraction
