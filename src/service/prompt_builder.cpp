#include "service/prompt_builder.hpp"

namespace kbengine {

const char* const kDefaultContextPrefix =
    "\n\n## Informações Relevantes da Base de Conhecimento\n\n"
    "Use as seguintes informações para responder à pergunta do usuário:\n\n";

const char* const kDefaultContextSuffix =
    "\n\n---\n\n"
    "Responda à pergunta do usuário usando as informações acima quando relevante. "
    "Se a informação não estiver disponível, responda com seu conhecimento geral.";

std::string build_prompt_with_context(const std::string& base_prompt,
                                      const KnowledgeContextResult& knowledge_context,
                                      const PromptOptions& options) {
    if (!knowledge_context.has_context) {
        return base_prompt;
    }

    std::string prompt = base_prompt;
    prompt.append(options.context_prefix.value_or(kDefaultContextPrefix));
    prompt.append(knowledge_context.context);
    prompt.append(options.context_suffix.value_or(kDefaultContextSuffix));
    return prompt;
}

}  // namespace kbengine
