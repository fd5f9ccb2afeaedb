#include "encounter_gen.hpp"
#include "rng.hpp"
#include "theme_catalog.hpp"

#include <array>
#include <cctype>
#include <sstream>

namespace {

static constexpr std::array<const char*, 6> QUEST_TEMPLATES = {
    "Slay {count} {monsters}",
    "Find the {treasure} of {location}",
    "Rescue {npc} from {location}",
    "Retrieve the {artifact} for {npc}",
    "Explore the depths of {location}",
    "Survive {count} encounters",
};

static constexpr std::array<const char*, 6> MONSTER_NAMES = {
    "goblins", "skeletons", "cultists", "giant rats", "bandits", "cave spiders",
};

static constexpr std::array<const char*, 4> TREASURE_NAMES = {
    "Chalice", "Crown", "Ledger", "Lantern",
};

static constexpr std::array<const char*, 4> NPC_NAMES = {
    "Brother Aldric", "Captain Mira", "the cartographer Venn", "old Hollis",
};

static constexpr std::array<const char*, 4> ARTIFACT_NAMES = {
    "Sunstone Amulet", "Ember Blade", "Ashen Codex", "Warden's Key",
};

template <size_t N>
const char* pick(const std::array<const char*, N>& table, uint32_t h) {
    return table[static_cast<size_t>(h % static_cast<uint32_t>(N))];
}

uint32_t roomSeed(const DungeonMap& d, uint32_t tag, int roomId) {
    return hashCombine(d.seed, tag, static_cast<uint32_t>(roomId));
}

const char* articleFor(const char* word) {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(word[0])));
    return (c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u') ? "An" : "A";
}

std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

void replaceAll(std::string& s, const std::string& key, const std::string& value) {
    size_t pos = 0;
    while ((pos = s.find(key, pos)) != std::string::npos) {
        s.replace(pos, key.size(), value);
        pos += value.size();
    }
}

} // namespace

const char* encounterTypeName(EncounterType t) {
    switch (t) {
        case EncounterType::MonsterPack:   return "monster_pack";
        case EncounterType::TreasureRoom:  return "treasure_room";
        case EncounterType::TrapGauntlet:  return "trap_gauntlet";
        case EncounterType::BossRoom:      return "boss_room";
        case EncounterType::PuzzleChamber: return "puzzle_chamber";
    }
    return "monster_pack";
}

float encounterBaseDifficulty(EncounterType t) {
    switch (t) {
        case EncounterType::MonsterPack:   return 0.5f;
        case EncounterType::TreasureRoom:  return 0.3f;
        case EncounterType::TrapGauntlet:  return 0.4f;
        case EncounterType::BossRoom:      return 0.9f;
        case EncounterType::PuzzleChamber: return 0.6f;
    }
    return 0.5f;
}

Encounter encounterForRoom(const DungeonMap& d, const Room& r) {
    Encounter e;
    e.roomId = r.id;

    if (r.isBoss()) e.type = EncounterType::BossRoom;
    else if (r.traps > r.monsters) e.type = EncounterType::TrapGauntlet;
    else if (r.treasures > 0) e.type = EncounterType::TreasureRoom;
    else if (roomSeed(d, tag32("PUZZLE"), r.id) % 5u == 0u) e.type = EncounterType::PuzzleChamber;
    else e.type = EncounterType::MonsterPack;

    const int level = d.area.recommendedLevel > 0 ? d.area.recommendedLevel : 1;
    const int extra = r.monsters > 1 ? r.monsters - 1 : 0;
    e.difficulty = encounterBaseDifficulty(e.type) * static_cast<float>(level) *
                   (1.0f + 0.1f * static_cast<float>(extra));
    return e;
}

std::vector<Encounter> deriveEncounters(const DungeonMap& d) {
    std::vector<Encounter> out;
    for (const Room& r : d.rooms) {
        if (r.monsters <= 0) continue;
        out.push_back(encounterForRoom(d, r));
    }
    return out;
}

std::string describeRoom(const DungeonMap& d, const Room& r) {
    const ThemeInfo& info = themeInfo(d.area.theme);
    const uint32_t h = roomSeed(d, tag32("ROOMDESC"), r.id);

    const char* adj = pick(info.adjectives, h);
    const char* noun = pick(info.roomNouns, h >> 8);
    const char* tile = pick(info.tileNouns, h >> 16);
    const char* mood = pick(info.ambience, h >> 24);

    std::ostringstream ss;
    ss << articleFor(adj) << " " << adj << " " << noun << ", " << r.w << " by " << r.h << " feet. ";
    ss << capitalized(tile) << " all around. " << mood;

    if (r.isSpawn() && r.isBoss()) {
        ss << " The way in, and the lair of whatever rules this place.";
    } else if (r.isSpawn()) {
        ss << " This is where the expedition begins.";
    } else if (r.isBoss()) {
        ss << " Something powerful has made its lair here.";
    }

    if (!r.isBoss()) {
        if (r.monsters == 1) ss << " A lone creature lurks here.";
        else if (r.monsters > 1) ss << " " << r.monsters << " creatures lurk here.";
    }
    if (r.treasures > 0) ss << " Something glints in the shadows.";
    if (r.traps > 0) ss << " The floor looks treacherous.";
    return ss.str();
}

std::string describeArea(const DungeonMap& d) {
    const ThemeInfo& info = themeInfo(d.area.theme);
    std::ostringstream ss;
    ss << d.area.name << " (" << info.displayName << "): " << info.description << ". "
       << d.rooms.size() << (d.rooms.size() == 1 ? " room" : " rooms")
       << ", recommended level " << d.area.recommendedLevel << ".";
    return ss.str();
}

QuestHook deriveQuest(const DungeonMap& d) {
    const ThemeInfo& info = themeInfo(d.area.theme);
    const uint32_t h = hashCombine(d.seed, tag32("QUEST"), static_cast<uint32_t>(d.area.theme));

    int totalMonsters = 0;
    for (const Room& r : d.rooms) totalMonsters += r.monsters;
    const int count = totalMonsters > 0 ? totalMonsters : 1;

    std::string title = pick(QUEST_TEMPLATES, h);
    replaceAll(title, "{count}", std::to_string(count));
    replaceAll(title, "{monsters}", pick(MONSTER_NAMES, h >> 4));
    replaceAll(title, "{treasure}", pick(TREASURE_NAMES, h >> 8));
    replaceAll(title, "{npc}", pick(NPC_NAMES, h >> 12));
    replaceAll(title, "{artifact}", pick(ARTIFACT_NAMES, h >> 16));
    replaceAll(title, "{location}", info.displayName);

    QuestHook q;
    q.title = title;
    q.difficulty = clampi(d.area.recommendedLevel + totalMonsters / 8, 1, 10);
    q.reward = q.difficulty * 100;
    q.location = info.displayName;
    return q;
}
