// EN: Exceptions raised by the relic layer when an input file cannot be used
// FR: Exceptions levées par la couche relique quand un fichier d'entrée est inutilisable

#pragma once

#include <stdexcept>
#include <string>

namespace RIE {

// EN: Unreadable or undecodable import/snapshot file; the session state is left untouched
// FR: Fichier d'import/snapshot illisible ou non décodable ; l'état de la session reste intact
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Snapshot decoded as JSON but missing required keys or structurally invalid
// FR: Snapshot décodé en JSON mais sans les clés requises ou structurellement invalide
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace RIE
