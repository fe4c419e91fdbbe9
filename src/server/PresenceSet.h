#pragma once
#include <string>
#include <vector>

// Players currently online, kept in join order without duplicates.
class PresenceSet {
public:
    // Returns false when the player was already present.
    bool add(const std::string& player);
    // Returns false when the player was not present.
    bool remove(const std::string& player);

    bool contains(const std::string& player) const;
    void clear() { players.clear(); }

    size_t size() const { return players.size(); }
    bool empty() const { return players.empty(); }
    std::vector<std::string> list() const { return players; }

private:
    std::vector<std::string> players;
};
