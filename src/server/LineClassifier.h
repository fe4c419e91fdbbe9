#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "server/PresenceSet.h"

enum class PresenceKind {
    Join,
    Leave
};

/**
 * @brief One row of the pattern table.
 *
 * pattern is an ECMAScript regex searched anywhere in the line;
 * captureIndex selects the group holding the player identifier.
 */
struct PatternRule {
    PresenceKind kind;
    std::string pattern;
    size_t captureIndex = 1;
};

using PatternTable = std::vector<PatternRule>;

struct PresenceEvent {
    PresenceKind kind;
    std::string player;
};

/**
 * @brief Turns raw server log lines into presence mutations.
 *
 * Rules are tried in table order and the first one that matches with a
 * non-empty capture decides the line. Log wording differs between server
 * versions, so the table is data supplied by the configuration.
 */
class LineClassifier {
public:
    /**
     * @throws std::runtime_error on an invalid regex or a capture index the
     *         pattern does not have.
     */
    explicit LineClassifier(const PatternTable& table = defaultTable());

    static PatternTable defaultTable();

    std::optional<PresenceEvent> classify(const std::string& line) const;

    /**
     * @brief Apply an event to the set. Returns true if the set changed.
     */
    static bool apply(const PresenceEvent& event, PresenceSet& presence);

    // classify + apply
    bool feed(const std::string& line, PresenceSet& presence) const;

    size_t ruleCount() const { return rules.size(); }

    static const char* kindName(PresenceKind kind);
    static std::optional<PresenceKind> parseKind(const std::string& name);

private:
    struct CompiledRule {
        PresenceKind kind;
        std::regex regex;
        size_t captureIndex;
    };
    std::vector<CompiledRule> rules;
};
