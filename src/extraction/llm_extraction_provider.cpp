#include <cairn/extraction/extraction_provider.h>
#include <cairn/ml/provider.h>

#include <spdlog/spdlog.h>

namespace cairn::extraction {

LlmExtractionProvider::LlmExtractionProvider(std::shared_ptr<ml::ICompletionProvider> completion)
    : completion_(std::move(completion)) {}

Result<std::vector<Proposition>> LlmExtractionProvider::extract(const std::string& text) {
    if (!completion_) {
        return Error{ErrorCode::NotInitialized, "Extraction provider has no completion model"};
    }

    auto raw = completion_->complete(text, extractionSystemPrompt());
    if (!raw) {
        spdlog::warn("Extraction call to {} failed: {}", completion_->getProviderName(),
                     raw.error().message);
        return raw.error();
    }
    return parseExtractionResponse(raw.value());
}

} // namespace cairn::extraction
