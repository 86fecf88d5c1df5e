#pragma once

#include <ghmcp/core/result.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ghmcp {

// ---------------------------------------------------------------------------
// SecretPattern: a literal prefix followed by exactly
// `body_length` ASCII alphanumerics. A match keeps the prefix and replaces
// the body with `mask` characters of the same length.
// ---------------------------------------------------------------------------
struct SecretPattern {
    std::string prefix;
    std::size_t body_length = 0;
    char mask = '*';
};

/// GitHub token families: ghp_, gho_, ghu_, ghs_, ghr_ with 36-char bodies.
std::vector<SecretPattern> DefaultSecretPatterns();

// ---------------------------------------------------------------------------
// Redactor: masks secret-shaped substrings in log payloads.
//
// Patterns are compiled once at construction; Redact() is const and may be
// called concurrently from any thread. Input is never modified.
// ---------------------------------------------------------------------------
class Redactor {
public:
    /// Redactor with DefaultSecretPatterns().
    Redactor();

    /// Validate and compile custom patterns. Rejects an empty prefix, a zero
    /// body length, and an alphanumeric mask character.
    static Result<Redactor, Error> Create(std::vector<SecretPattern> patterns);

    [[nodiscard]] std::string Redact(std::string_view payload) const;

    [[nodiscard]] const std::vector<SecretPattern>& Patterns() const noexcept {
        return patterns_;
    }

private:
    explicit Redactor(std::vector<SecretPattern> patterns);

    std::vector<SecretPattern> patterns_;
    std::vector<std::regex> compiled_;
};

/// Redact with the process-wide default Redactor.
std::string Redact(std::string_view payload);

} // namespace ghmcp
