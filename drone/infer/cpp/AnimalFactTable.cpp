#include "../hpp/AnimalFactTable.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

AnimalDetails makeEntry(const char* title, const char* fact, const char* habitat, const char* emoji,
                        const char* diet, const char* lifespan, const char* speed,
                        const char* weight, const char* collectiveNoun) {
    AnimalDetails d;
    d.title = title;
    d.fact = fact;
    d.habitat = habitat;
    d.emoji = emoji;
    d.diet = diet;
    d.lifespan = lifespan;
    d.speed = speed;
    d.weight = weight;
    d.collectiveNoun = collectiveNoun;
    return d;
}

} // namespace

AnimalFactTable::AnimalFactTable(std::unordered_map<std::string, AnimalDetails> entries) {
    for (auto& kv : entries) {
        this->entries.emplace(toLower(kv.first), std::move(kv.second));
    }
}

AnimalFactTable AnimalFactTable::builtin() {
    std::unordered_map<std::string, AnimalDetails> table;
    table["zebra"] = makeEntry("Zebra", "Zebras have unique stripe patterns, like human fingerprints!",
                               "African Savannas", "\U0001F993", "Herbivore", "25 years", "65 km/h",
                               "300-400 kg", "A dazzle of zebras");
    table["elephant"] = makeEntry("Elephant", "Elephants are the largest land animals and have amazing memory.",
                                  "Forests & Savannas", "\U0001F418", "Herbivore", "60-70 years", "40 km/h",
                                  "6,000 kg", "A parade of elephants");
    table["cat"] = makeEntry("Cat", "Cats can jump up to six times their length.",
                             "Domestic", "\U0001F431", "Carnivore", "12-18 years", "48 km/h",
                             "4-5 kg", "A clowder of cats");
    table["dog"] = makeEntry("Dog", "Dogs are known as 'man's best friend' for their loyalty.",
                             "Domestic", "\U0001F436", "Omnivore", "10-13 years", "30-70 km/h",
                             "10-40 kg", "A pack of dogs");
    table["bird"] = makeEntry("Bird", "Some birds, like crows, are incredibly intelligent and can use tools.",
                              "Worldwide", "\U0001F426", "Varied", "2-100 years", "Varied",
                              "Varied", "A flock of birds");
    table["horse"] = makeEntry("Horse", "Horses can sleep both lying down and standing up.",
                               "Plains & Fields", "\U0001F434", "Herbivore", "25-30 years", "88 km/h",
                               "380-1,000 kg", "A herd of horses");
    table["sheep"] = makeEntry("Sheep", "Sheep have specialized rectangular pupils for panoramic vision.",
                               "Grasslands", "\U0001F411", "Herbivore", "10-12 years", "40 km/h",
                               "45-160 kg", "A flock of sheep");
    table["cow"] = makeEntry("Cow", "Cows are social animals and make friends with each other.",
                             "Farms & Grasslands", "\U0001F42E", "Herbivore", "15-20 years", "40 km/h",
                             "720 kg", "A herd of cows");
    table["bear"] = makeEntry("Bear", "Bears have an excellent sense of smell, arguably better than dogs.",
                              "Forests & Mountains", "\U0001F43B", "Omnivore", "20-30 years", "55 km/h",
                              "100-600 kg", "A sloth of bears");
    table["giraffe"] = makeEntry("Giraffe", "A giraffe's neck is too short to reach the ground.",
                                 "African Savannas", "\U0001F992", "Herbivore", "25 years", "60 km/h",
                                 "800-1,200 kg", "A tower of giraffes");
    return AnimalFactTable(std::move(table));
}

AnimalDetails AnimalFactTable::lookup(const std::string& label) const {
    auto it = entries.find(toLower(label));
    if (it != entries.end()) {
        return it->second;
    }
    AnimalDetails fallback;
    fallback.title = capitalize(label);
    fallback.fact = "An interesting creature detected by the drone!";
    fallback.habitat = "Unknown";
    fallback.emoji = "\U0001F43E";
    return fallback;
}

bool AnimalFactTable::contains(const std::string& label) const {
    return entries.count(toLower(label)) > 0;
}

std::string AnimalFactTable::toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// 首字母大写，其余小写（"tEDDY bear" -> "Teddy bear"）
std::string AnimalFactTable::capitalize(const std::string& s) {
    std::string out = toLower(s);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}
