// EN: Canonical "[Faction] name" formatting for relic names
// FR: Formatage canonique "[Faction] nom" des noms de reliques

#pragma once

#include "relic/dataset.hpp"
#include "relic/relic_record.hpp"
#include <optional>
#include <string>

namespace RIE {

class NameStandardizer {
public:
    // EN: Rewrite "Tag: x" and "Tag x" as "[Tag] x", add the given faction tag when missing,
    //     and turn every "- " into ", ".
    // FR: Réécrit "Tag: x" et "Tag x" en "[Tag] x", ajoute le tag de faction fourni s'il manque,
    //     et remplace chaque "- " par ", ".
    static std::string standardize(const std::string& name, std::optional<Nightfarer> nightfarer = std::nullopt);

    // EN: Two passes over the dataset: records with a faction use their own tag, then every name
    //     still lacking a bracket tag gets the untargeted rewrite. Returns the number of names changed.
    // FR: Deux passes sur le dataset : les enregistrements avec faction utilisent leur propre tag, puis chaque
    //     nom encore sans tag reçoit la réécriture non ciblée. Retourne le nombre de noms modifiés.
    static size_t standardizeDataset(Dataset& dataset);
};

} // namespace RIE
