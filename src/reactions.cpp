#include "reactions.hpp"

const std::array<Reaction, kReactionCount>& reaction_catalog() {
  static const std::array<Reaction, kReactionCount> catalog = {{
    {"+1", "+1", "\xF0\x9F\x91\x8D"},
    {"-1", "-1", "\xF0\x9F\x91\x8E"},
    {"laugh", "laugh", "\xF0\x9F\x98\x84"},
    {"confused", "confused", "\xF0\x9F\x98\x95"},
    {"heart", "heart", "\xE2\x9D\xA4\xEF\xB8\x8F"},
    {"hooray", "hooray", "\xF0\x9F\x8E\x89"},
    {"rocket", "rocket", "\xF0\x9F\x9A\x80"},
    {"eyes", "eyes", "\xF0\x9F\x91\x80"},
  }};
  return catalog;
}

const Reaction& reaction_at(size_t index) {
  return reaction_catalog()[index % kReactionCount];
}

size_t next_reaction(size_t index) {
  return (index + 1) % kReactionCount;
}

int reaction_index(const std::string& name) {
  const auto& cat = reaction_catalog();
  for (size_t i = 0; i < cat.size(); ++i) if (name == cat[i].name) return static_cast<int>(i);
  return -1;
}
