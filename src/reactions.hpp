#pragma once
/*
 * Reactions
 *
 * Purpose: the fixed reaction catalog offered by ReactionPick. Order is part of the
 *          contract with the host: +1, -1, laugh, confused, heart, hooray, rocket, eyes.
 */
#include <array>
#include <string>

struct Reaction {
  const char* name;    // value passed to the reaction completer
  const char* display; // shown in the status line
  const char* emoji;
};

constexpr size_t kReactionCount = 8;

const std::array<Reaction, kReactionCount>& reaction_catalog();
const Reaction& reaction_at(size_t index); // wraps modulo kReactionCount
size_t next_reaction(size_t index);
// -1 when the name is not in the catalog
int reaction_index(const std::string& name);
