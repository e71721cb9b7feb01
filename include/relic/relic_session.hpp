// EN: Session owning the dataset and the sort state. Front ends drive every operation through it.
// FR: Session propriétaire du dataset et de l'état de tri. Les interfaces passent par elle pour toute opération.

#pragma once

#include "csv/streaming_parser.hpp"
#include "relic/dataset.hpp"
#include "relic/duplicate_merger.hpp"
#include "relic/group_autofiller.hpp"
#include "relic/project_store.hpp"
#include "relic/record_ingestor.hpp"
#include "relic/session_options.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace RIE {

class RelicSession {
public:
    RelicSession();
    explicit RelicSession(const SessionOptions& options);

    // EN: Import replaces the whole dataset, then runs standardize, merge and autofill
    //     when at least one record was imported. ParseError leaves the session untouched.
    // FR: L'import remplace tout le dataset, puis lance standardisation, fusion et autofill
    //     si au moins un enregistrement a été importé. ParseError laisse la session intacte.
    ImportSummary importCsvFile(const std::string& path);
    ImportSummary importCsvString(const std::string& content);
    ImportSummary importRows(const std::vector<CSV::ParsedRow>& rows);

    nlohmann::ordered_json exportRecords() const;
    void exportToFile(const std::string& path) const;

    void saveSnapshot(const std::string& path) const;
    void loadSnapshot(const std::string& path);
    ProjectSnapshot snapshot() const;
    void restore(ProjectSnapshot snapshot);

    const std::vector<RelicRecord>& getRecords() const { return dataset_.records; }
    const Dataset& getDataset() const { return dataset_; }
    const RelicRecord* findRecord(std::int64_t id) const;

    // EN: Manual edit of category, displayGroup, levelGroup, level or stacks.
    //     A blank value clears the field, other values are trimmed and remembered in the used-value set.
    //     Throws std::invalid_argument for an unknown field, a non-integer level or stacks other than Yes/No.
    //     Returns the number of records updated; unknown ids are ignored.
    // FR: Édition manuelle de category, displayGroup, levelGroup, level ou stacks.
    //     Une valeur vide efface le champ, les autres sont nettoyées et mémorisées dans l'ensemble des valeurs utilisées.
    //     Lance std::invalid_argument pour un champ inconnu, un niveau non entier ou un stacks autre que Yes/No.
    //     Retourne le nombre d'enregistrements modifiés ; les ids inconnus sont ignorés.
    size_t setField(const std::vector<std::int64_t>& ids, const std::string& field, const std::string& value);

    const std::set<std::string>& getUsedValues(const std::string& field) const;

    // EN: Same column toggles the direction, a new column sorts ascending. Stable.
    // FR: La même colonne inverse le sens, une nouvelle colonne trie en ordre croissant. Stable.
    void sortBy(const std::string& column);
    const std::optional<std::string>& getSortColumn() const { return sort_column_; }
    bool isSortReversed() const { return sort_reverse_; }

    size_t standardizeNames();
    MergeStatistics mergeDuplicates();
    AutofillStatistics autofillGroups();

    void clear();

    const SessionOptions& getOptions() const { return options_; }

private:
    SessionOptions options_;
    Dataset dataset_;
    std::optional<std::string> sort_column_;
    bool sort_reverse_{false};

    void runImportPipeline();
};

} // namespace RIE
