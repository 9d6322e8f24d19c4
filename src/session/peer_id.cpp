#include "session/peer_id.hpp"
#include <array>
#include <cctype>
#include <random>

namespace peerdrop {
namespace session {

namespace {

const std::array<const char*, 60> ADJECTIVES = {
    "happy", "sunny", "brave", "calm", "cool", "cute", "fast", "kind",
    "neat", "nice", "quiet", "smart", "soft", "warm", "wild", "wise",
    "bold", "bright", "clean", "clever", "cozy", "eager", "fair", "fancy",
    "gentle", "glad", "golden", "grand", "great", "jolly", "keen", "lively",
    "lucky", "merry", "mighty", "noble", "proud", "pure", "quick", "rapid",
    "rich", "royal", "sharp", "shiny", "silver", "simple", "smooth", "snowy",
    "spicy", "steady", "strong", "super", "sweet", "swift", "tender", "tiny",
    "vivid", "witty", "young", "zesty"
};

const std::array<const char*, 61> NOUNS = {
    "apple", "banana", "cherry", "dolphin", "eagle", "falcon", "grape",
    "harbor", "island", "jungle", "kitten", "lemon", "mango", "nectar",
    "orange", "panda", "quartz", "rabbit", "sunset", "tiger", "umbrella",
    "violet", "walrus", "xenon", "yellow", "zebra", "anchor", "breeze",
    "castle", "dragon", "ember", "forest", "glacier", "horizon", "indigo",
    "jasper", "kraken", "lantern", "meadow", "nebula", "ocean", "phoenix",
    "quasar", "river", "shadow", "thunder", "unicorn", "vortex", "willow",
    "crystal", "dusk", "echo", "flame", "glow", "haze", "iris", "jewel",
    "karma", "lotus", "moon", "nova"
};

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string generate_peer_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> adjective(0, ADJECTIVES.size() - 1);
    std::uniform_int_distribution<std::size_t> noun(0, NOUNS.size() - 1);

    return std::string(ADJECTIVES[adjective(gen)]) + "-" + NOUNS[noun(gen)] + "-" + NOUNS[noun(gen)];
}

bool is_valid_peer_id(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    if (!is_alnum(id.front()) || !is_alnum(id.back())) {
        return false;
    }
    for (char c : id) {
        if (!is_alnum(c) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace session
} // namespace peerdrop
