// EN: Stateless string helpers shared by the standardizer, the merger and the autofiller
// FR: Fonctions de chaîne sans état partagées par le standardiseur, le fusionneur et l'autofill

#pragma once

#include "relic/relic_record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RIE {
namespace TextSimilarity {

// EN: Whitespace trimming (ASCII whitespace only)
// FR: Suppression des espaces (espaces ASCII uniquement)
std::string trim(const std::string& value);
std::string trimLeft(const std::string& value);
std::string trimRight(const std::string& value);

bool startsWith(const std::string& value, const std::string& prefix);
bool endsWith(const std::string& value, const std::string& suffix);
std::string toLowerAscii(const std::string& value);

// EN: Split on runs of whitespace, dropping empty pieces
// FR: Découpe sur les suites d'espaces, sans morceaux vides
std::vector<std::string> splitWords(const std::string& value);
std::string joinWords(const std::vector<std::string>& words, size_t count);

// EN: Faction whose "[Tag] " prefix opens the name, if any
// FR: Faction dont le préfixe "[Tag] " ouvre le nom, le cas échéant
std::optional<Nightfarer> bracketTag(const std::string& name);

// EN: Name without its leading "[Tag] " prefix (unchanged when there is none)
// FR: Nom sans son préfixe "[Tag] " (inchangé s'il n'y en a pas)
std::string stripBracketTag(const std::string& name);

// EN: Longest common prefix, kept only when longer than 3 chars and ending on ' ', '-' or ','. Right-trimmed.
// FR: Plus long préfixe commun, gardé seulement s'il dépasse 3 caractères et finit par ' ', '-' ou ','. Tronqué à droite.
std::string commonPrefix(const std::vector<std::string>& names);

// EN: Mirror of commonPrefix at the end of the names. Left-trimmed.
// FR: Symétrique de commonPrefix en fin de nom. Tronqué à gauche.
std::string commonSuffix(const std::vector<std::string>& names);

// EN: Leading words identical in every name, joined by single spaces
// FR: Mots de tête identiques dans tous les noms, joints par un espace
std::string commonLeadingWords(const std::vector<std::string>& names);

// EN: Longest case-insensitive substring of the shortest name present in all names.
//     At least 3 chars, and either ending on a separator or at least 10 chars long.
//     The most frequent original casing is returned (first seen wins ties), trailing '+' removed,
//     first letter upper-cased.
// FR: Plus longue sous-chaîne (insensible à la casse) du nom le plus court présente dans tous les noms.
//     Au moins 3 caractères, et finissant par un séparateur ou d'au moins 10 caractères.
//     La casse d'origine la plus fréquente est retournée (la première vue l'emporte en cas d'égalité),
//     '+' final retiré, première lettre en majuscule.
std::string longestCommonSubstring(const std::vector<std::string>& names);

// EN: True when every word of shorter appears in longer, in order
// FR: Vrai quand chaque mot de shorter apparaît dans longer, dans l'ordre
bool isWordSubsequence(const std::vector<std::string>& shorter, const std::vector<std::string>& longer);

// EN: True when longer is shorter with exactly one word inserted somewhere
// FR: Vrai quand longer est shorter avec exactement un mot inséré quelque part
bool hasSingleWordInsertion(const std::vector<std::string>& shorter, const std::vector<std::string>& longer);

bool areWordVariants(const std::string& first, const std::string& second);

// EN: Whether two names denote the same relic, one being a truncated or reworded form of the other.
//     Bracket tags are ignored.
// FR: Indique si deux noms désignent la même relique, l'un étant une forme tronquée ou reformulée de l'autre.
//     Les tags entre crochets sont ignorés.
bool isTruncatedVariant(const std::string& first, const std::string& second);

} // namespace TextSimilarity
} // namespace RIE
