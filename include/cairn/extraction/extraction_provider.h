#pragma once

#include <cairn/core/types.h>
#include <cairn/extraction/proposition.h>

#include <memory>
#include <string>
#include <vector>

namespace cairn::ml {
class ICompletionProvider;
}

namespace cairn::extraction {

/**
 * Turns free text into validated propositions.
 * Failures: NetworkError/Timeout/ProviderError when the model could not be asked,
 * ExtractionError when it answered with something off-schema.
 */
class IExtractionProvider {
public:
    virtual ~IExtractionProvider() = default;

    virtual Result<std::vector<Proposition>> extract(const std::string& text) = 0;
};

/**
 * Extraction over a completion model, driven by extractionSystemPrompt().
 */
class LlmExtractionProvider final : public IExtractionProvider {
public:
    explicit LlmExtractionProvider(std::shared_ptr<ml::ICompletionProvider> completion);

    Result<std::vector<Proposition>> extract(const std::string& text) override;

private:
    std::shared_ptr<ml::ICompletionProvider> completion_;
};

const std::string& extractionSystemPrompt();

} // namespace cairn::extraction
