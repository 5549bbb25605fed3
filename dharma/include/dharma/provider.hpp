#pragma once
// Provider: one chat completion against a language model
//
// Implementations wrap a vendor API. Errors throw std::exception subclasses
// whose what() may contain the vendor's text (status codes, quota
// messages); verify/repair classifies failures from that text.

#include <optional>
#include <string>

namespace dharma {

class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string chat_with_system(const std::optional<std::string>& system_prompt,
                                         const std::string& message,
                                         const std::string& model,
                                         double temperature) = 0;
};

} // namespace dharma
