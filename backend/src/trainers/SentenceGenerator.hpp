#pragma once
#include <optional>
#include <stdexcept>
#include <string>

// Raised (through the render future) when fill-in-blank content cannot be produced
class GenerationUnavailable : public std::runtime_error {
public:
    explicit GenerationUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

// Source of natural sentences for fill-in-blank mode. May block (network, model).
class SentenceGenerator {
public:
    virtual ~SentenceGenerator() = default;

    // A sentence using `term`, with `context` (the back of the item) as guidance.
    // nullopt means the generator is unavailable right now.
    virtual std::optional<std::string> generateSentence(const std::string& term,
        const std::string& context) = 0;
};

// Offline source: picks the first sentence of the back content that mentions the term.
class BackContentSentenceGenerator : public SentenceGenerator {
public:
    std::optional<std::string> generateSentence(const std::string& term,
        const std::string& context) override;
};
