#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace kbengine {

// Data-driven rules for deciding whether an utterance is worth a retrieval round-trip.
// Patterns are ECMAScript regular expressions matched against the trimmed,
// ASCII-lowercased query.
struct GateRules {
    int version = 0;
    std::size_t min_length = 5;
    std::size_t min_tokens = 3;
    // Small talk: greetings, farewells and acknowledgements. A match skips the search.
    std::vector<std::string> skip_patterns;
    // Questions and explicit information requests. A match forces the search.
    std::vector<std::string> search_patterns;
};

// Version 1: Portuguese and English small talk, Portuguese interrogatives.
const GateRules& default_gate_rules();

class QueryGate {
public:
    // Throws ConfigurationError if a pattern does not compile.
    explicit QueryGate(GateRules rules);

    bool should_search(std::string_view query) const;
    int version() const noexcept { return version_; }

private:
    int version_;
    std::size_t min_length_;
    std::size_t min_tokens_;
    std::vector<std::regex> skip_;
    std::vector<std::regex> search_;
};

// The default-rules gate.
bool should_search_knowledge_base(std::string_view query);

}  // namespace kbengine
