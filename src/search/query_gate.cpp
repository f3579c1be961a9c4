#include "search/query_gate.hpp"

#include "core/errors.hpp"
#include "util/text.hpp"

namespace kbengine {
namespace {

// A leading word only counts when followed by end of text, whitespace or punctuation.
constexpr const char* kWordEnd = "(?=$|[\\s!?.,;:])";

std::vector<std::regex> compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& ex) {
            throw ConfigurationError("invalid query gate pattern '" + pattern + "': " + ex.what());
        }
    }
    return compiled;
}

bool any_match(const std::vector<std::regex>& patterns, const std::string& value) {
    for (const auto& pattern : patterns) {
        if (std::regex_search(value, pattern)) {
            return true;
        }
    }
    return false;
}

}  // namespace

const GateRules& default_gate_rules() {
    static const GateRules rules{
        .version = 1,
        .min_length = 5,
        .min_tokens = 3,
        .skip_patterns =
            {
                std::string{"^(oi|olá|ola|hey|hi|hello|bom dia|boa tarde|boa noite|e aí|eai|tudo bem)"} + kWordEnd,
                std::string{"^(tchau|adeus|bye|até|xau|vlw|valeu|obrigad[oa]|thanks)"} + kWordEnd,
                "^(sim|não|nao|ok|certo|entendi|beleza)\\s*[!?.]*$",
            },
        .search_patterns =
            {
                "\\?",
                "^(o que|qual|quais|como|onde|quando|por ?que|quem)",
                "^(me (diga|fale|explique|conte)|pode|poderia|gostaria)",
                "(preciso|quero|desejo) (saber|entender|conhecer)",
            },
    };
    return rules;
}

QueryGate::QueryGate(GateRules rules)
    : version_(rules.version),
      min_length_(rules.min_length),
      min_tokens_(rules.min_tokens),
      skip_(compile(rules.skip_patterns)),
      search_(compile(rules.search_patterns)) {}

bool QueryGate::should_search(std::string_view query) const {
    const std::string normalized = text::to_lower_ascii(text::trim(query));
    if (text::utf8_length(normalized) < min_length_) {
        return false;
    }
    if (any_match(skip_, normalized)) {
        return false;
    }
    if (any_match(search_, normalized)) {
        return true;
    }
    return text::split_whitespace(normalized).size() >= min_tokens_;
}

bool should_search_knowledge_base(std::string_view query) {
    static const QueryGate gate{default_gate_rules()};
    return gate.should_search(query);
}

}  // namespace kbengine
