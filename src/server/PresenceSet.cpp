#include "server/PresenceSet.h"
#include <algorithm>

bool PresenceSet::add(const std::string& player) {
    if (contains(player)) return false;
    players.push_back(player);
    return true;
}

bool PresenceSet::remove(const std::string& player) {
    auto it = std::find(players.begin(), players.end(), player);
    if (it == players.end()) return false;
    players.erase(it);
    return true;
}

bool PresenceSet::contains(const std::string& player) const {
    return std::find(players.begin(), players.end(), player) != players.end();
}
