#pragma once

#include <optional>
#include <string>

#include "service/retrieval_service.hpp"

namespace kbengine {

struct PromptOptions {
    std::optional<std::string> context_prefix;
    std::optional<std::string> context_suffix;
};

extern const char* const kDefaultContextPrefix;
extern const char* const kDefaultContextSuffix;

// base_prompt + prefix + context + suffix, or base_prompt alone when there is no context.
std::string build_prompt_with_context(const std::string& base_prompt,
                                      const KnowledgeContextResult& knowledge_context,
                                      const PromptOptions& options = {});

}  // namespace kbengine
