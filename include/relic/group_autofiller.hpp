// EN: Inference of level-group labels, level numbers and derived fields from relic names
// FR: Déduction des libellés de groupe de niveau, des niveaux et des champs dérivés depuis les noms

#pragma once

#include "relic/dataset.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RIE {

struct AutofillOptions {
    bool nightfarerDisplayGroup{true};  // EN: "[X] name" sets displayGroup X / FR: "[X] nom" fixe displayGroup à X
    bool debuffCategory{true};          // EN: Debuff records without category get "Debuff" / FR: Les debuffs sans catégorie reçoivent "Debuff"
    bool skipZeroGroup{false};          // EN: Leave levelGroupId 0 records alone / FR: Ignore les enregistrements de levelGroupId 0
};

struct AutofillStatistics {
    size_t displayGroupsFilled{0};
    size_t categoriesFilled{0};
    size_t groupsLabelled{0};
    size_t levelsAssigned{0};
};

class GroupAutofiller {
public:
    explicit GroupAutofiller(const AutofillOptions& options = AutofillOptions{});

    AutofillStatistics autofill(Dataset& dataset) const;

    // EN: Shared label for a group of names, empty when none qualifies
    // FR: Libellé commun à un groupe de noms, vide si aucun ne convient
    static std::string findCommonText(const std::vector<std::string>& names);

    // EN: N from a trailing " +N", nullopt otherwise
    // FR: N d'un " +N" final, nullopt sinon
    static std::optional<int> extractLevel(const std::string& name);

    // EN: Level numbers for one group: mixed -> 1 / N+1, all suffixed -> N, none -> untouched
    // FR: Niveaux pour un groupe : mixte -> 1 / N+1, tous suffixés -> N, aucun -> inchangé
    static size_t assignLevels(std::vector<RelicRecord*>& members);

private:
    AutofillOptions options_;

    void prefillDerivedFields(Dataset& dataset, AutofillStatistics& stats) const;
};

} // namespace RIE
