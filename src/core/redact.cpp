#include <ghmcp/core/redact.hpp>

#include <cctype>
#include <iterator>

namespace ghmcp {

namespace {

constexpr std::size_t kGitHubTokenBodyLength = 36;

std::string EscapeRegex(std::string_view literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{}/)";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::regex Compile(const SecretPattern& pattern) {
    return std::regex(EscapeRegex(pattern.prefix) + "[A-Za-z0-9]{" +
                          std::to_string(pattern.body_length) + "}",
                      std::regex::ECMAScript | std::regex::optimize);
}

std::string ApplyPattern(const std::string& input, const SecretPattern& pattern,
                         const std::regex& re) {
    std::string out;
    out.reserve(input.size());
    auto last = input.cbegin();
    for (std::sregex_iterator it(input.cbegin(), input.cend(), re), end;
         it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += pattern.prefix;
        out.append(pattern.body_length, pattern.mask);
        last = m[0].second;
    }
    out.append(last, input.cend());
    return out;
}

} // anonymous namespace

std::vector<SecretPattern> DefaultSecretPatterns() {
    return {
        {"ghp_", kGitHubTokenBodyLength, '*'},
        {"gho_", kGitHubTokenBodyLength, '*'},
        {"ghu_", kGitHubTokenBodyLength, '*'},
        {"ghs_", kGitHubTokenBodyLength, '*'},
        {"ghr_", kGitHubTokenBodyLength, '*'},
    };
}

Redactor::Redactor() : Redactor(DefaultSecretPatterns()) {}

Redactor::Redactor(std::vector<SecretPattern> patterns)
    : patterns_(std::move(patterns)) {
    compiled_.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        compiled_.push_back(Compile(p));
    }
}

Result<Redactor, Error> Redactor::Create(std::vector<SecretPattern> patterns) {
    for (const auto& p : patterns) {
        std::string problem;
        if (p.prefix.empty()) {
            problem = "secret pattern prefix must not be empty";
        } else if (p.body_length == 0) {
            problem = "secret pattern '" + p.prefix + "' has zero body length";
        } else if (std::isalnum(static_cast<unsigned char>(p.mask))) {
            problem = "secret pattern '" + p.prefix +
                      "' uses an alphanumeric mask character";
        }
        if (!problem.empty()) {
            return Result<Redactor, Error>::Err(Error{
                "Redactor", "", std::nullopt, problem, std::nullopt,
                ErrorCategory::Config, std::nullopt});
        }
    }
    return Result<Redactor, Error>::Ok(Redactor(std::move(patterns)));
}

std::string Redactor::Redact(std::string_view payload) const {
    std::string out(payload);
    for (std::size_t i = 0; i < patterns_.size(); ++i) {
        // Cheap prefix check before running the regex.
        if (out.find(patterns_[i].prefix) == std::string::npos) {
            continue;
        }
        out = ApplyPattern(out, patterns_[i], compiled_[i]);
    }
    return out;
}

std::string Redact(std::string_view payload) {
    static const Redactor kDefault;
    return kDefault.Redact(payload);
}

} // namespace ghmcp
