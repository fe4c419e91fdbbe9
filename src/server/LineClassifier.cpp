#include "server/LineClassifier.h"
#include <stdexcept>

LineClassifier::LineClassifier(const PatternTable& table) {
    rules.reserve(table.size());
    for (const auto& rule : table) {
        std::regex compiled;
        try {
            compiled = std::regex(rule.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::runtime_error("Invalid log pattern '" + rule.pattern + "': " + e.what());
        }
        if (rule.captureIndex == 0 || rule.captureIndex > compiled.mark_count()) {
            throw std::runtime_error("Log pattern '" + rule.pattern + "' has no capture group " +
                                     std::to_string(rule.captureIndex));
        }
        rules.push_back({rule.kind, std::move(compiled), rule.captureIndex});
    }
}

PatternTable LineClassifier::defaultTable() {
    return {
        {PresenceKind::Join, "Player connected: (.+?),", 1},
        {PresenceKind::Leave, "Player disconnected: (.+?),", 1}
    };
}

std::optional<PresenceEvent> LineClassifier::classify(const std::string& line) const {
    std::smatch match;
    for (const auto& rule : rules) {
        if (!std::regex_search(line, match, rule.regex)) continue;
        if (!match[rule.captureIndex].matched || match[rule.captureIndex].length() == 0) continue;
        return PresenceEvent{rule.kind, match[rule.captureIndex].str()};
    }
    return std::nullopt;
}

bool LineClassifier::apply(const PresenceEvent& event, PresenceSet& presence) {
    if (event.kind == PresenceKind::Join) {
        return presence.add(event.player);
    }
    return presence.remove(event.player);
}

bool LineClassifier::feed(const std::string& line, PresenceSet& presence) const {
    auto event = classify(line);
    if (!event) return false;
    return apply(*event, presence);
}

const char* LineClassifier::kindName(PresenceKind kind) {
    return kind == PresenceKind::Join ? "join" : "leave";
}

std::optional<PresenceKind> LineClassifier::parseKind(const std::string& name) {
    if (name == "join") return PresenceKind::Join;
    if (name == "leave") return PresenceKind::Leave;
    return std::nullopt;
}
