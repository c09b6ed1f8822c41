#include "scriptgate/trust_source.h"

#include <sstream>

namespace scriptgate {

const char* source_kind_name(SourceKind k) {
    switch (k) {
        case SourceKind::MANUAL:        return "manual";
        case SourceKind::NOTE:          return "note";
        case SourceKind::EXTERNAL_FILE: return "file";
    }
    return "manual";
}

std::unordered_set<TrustEntry> parse_trust_lines(const std::string& body) {
    std::unordered_set<TrustEntry> out;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        // handles CRLF bodies as well: '\r' is whitespace for normalize()
        TrustEntry e = digest::normalize(line);
        if (e.empty()) continue;
        if (e[0] == TRUST_COMMENT_MARKER) continue;
        out.insert(std::move(e));
    }
    return out;
}

std::string normalize_note_ref(const std::string& ref) {
    static const std::string kSuffix = ".md";
    std::string r = ref;
    while (!r.empty() && (r.back() == ' ' || r.back() == '\t')) r.pop_back();
    size_t b = 0;
    while (b < r.size() && (r[b] == ' ' || r[b] == '\t')) b++;
    r = r.substr(b);
    if (r.size() > kSuffix.size() &&
        r.compare(r.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
        r.resize(r.size() - kSuffix.size());
    }
    return r;
}

std::string note_document_path(const std::string& ref) {
    return normalize_note_ref(ref) + ".md";
}

} // namespace scriptgate
