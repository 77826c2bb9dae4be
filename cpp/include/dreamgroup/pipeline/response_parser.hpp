#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dreamgroup::pipeline {

/**
 * Ordered list of named strategies for pulling a value of type T out of free-form oracle text.
 *
 * Each strategy is a (matcher, extractor) pair. parse() walks the strategies in insertion order;
 * the first one whose matcher accepts the text and whose extractor yields a value wins. When none
 * does, parse() returns nullopt and the caller applies its own fallback.
 */
template<typename T>
class ResponseParser {
public:
    using Matcher = std::function<bool(std::string_view)>;
    using Extractor = std::function<std::optional<T>(std::string_view)>;

    struct Strategy {
        std::string name;
        Matcher matches;
        Extractor extract;
    };

    struct Result {
        T value;
        std::string strategy;
    };

    ResponseParser& add(std::string name, Matcher matcher, Extractor extractor) {
        strategies_.push_back(Strategy{std::move(name), std::move(matcher), std::move(extractor)});
        return *this;
    }

    // Strategy with no precondition
    ResponseParser& add(std::string name, Extractor extractor) {
        return add(std::move(name), [](std::string_view) { return true; }, std::move(extractor));
    }

    std::optional<Result> parse(std::string_view text) const {
        for (const auto& strategy : strategies_) {
            if (!strategy.matches(text)) continue;
            if (auto value = strategy.extract(text)) {
                return Result{std::move(*value), strategy.name};
            }
        }
        return std::nullopt;
    }

    // Run a single strategy by name; nullopt if it is unknown or does not apply
    std::optional<T> apply(const std::string& name, std::string_view text) const {
        for (const auto& strategy : strategies_) {
            if (strategy.name != name) continue;
            if (!strategy.matches(text)) return std::nullopt;
            return strategy.extract(text);
        }
        return std::nullopt;
    }

    const std::vector<Strategy>& strategies() const { return strategies_; }

private:
    std::vector<Strategy> strategies_;
};

} // namespace dreamgroup::pipeline
