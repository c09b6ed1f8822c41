#pragma once
#include "digest.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace scriptgate {

enum class SourceKind {
    MANUAL,         // digest stored directly in configuration
    NOTE,           // document in the document store, one digest per line
    EXTERNAL_FILE,  // file outside the document corpus, same format
};

struct TrustSource {
    SourceKind kind{SourceKind::MANUAL};
    std::string ref;  // digest for MANUAL, note reference or file path otherwise

    bool operator==(const TrustSource& o) const { return kind == o.kind && ref == o.ref; }
    bool operator!=(const TrustSource& o) const { return !(*this == o); }
};

const char* source_kind_name(SourceKind k);

// Lines starting with this marker (after trimming) are comments.
constexpr char TRUST_COMMENT_MARKER = '#';

// Parse a line-oriented trust list body.
// Blank lines and comment lines are skipped, every other line is trimmed and
// normalized. Duplicates collapse. Digest shape is not validated.
std::unordered_set<TrustEntry> parse_trust_lines(const std::string& body);

// Note references are stored without the ".md" suffix.
std::string normalize_note_ref(const std::string& ref);

// Document path of a trust note: "security/hashes" -> "security/hashes.md".
std::string note_document_path(const std::string& ref);

} // namespace scriptgate
