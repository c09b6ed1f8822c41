#include "scriptgate/trust_store.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scriptgate {

static bool read_file(const std::string& path, std::string* out, std::string* err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (err) *err = "file not found: " + path;
        return false;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        if (err) *err = "read failed: " + path;
        return false;
    }
    *out = ss.str();
    return true;
}

// --- TrustSnapshot ---

bool TrustSnapshot::contains(const std::string& entry) const {
    if (entries_.empty()) return false;
    return entries_.count(digest::normalize(entry)) > 0;
}

std::vector<TrustEntry> TrustSnapshot::sorted_entries() const {
    std::vector<TrustEntry> v(entries_.begin(), entries_.end());
    std::sort(v.begin(), v.end());
    return v;
}

// --- TrustStore ---

TrustStore::TrustStore(IDocumentStore* docs)
    : docs_(docs), snap_(std::make_shared<const TrustSnapshot>()) {}

std::unordered_set<TrustEntry> TrustStore::read_source(const TrustSource& src, SourceReport* rep) const {
    std::string body;
    std::string err;
    bool ok = false;

    switch (src.kind) {
        case SourceKind::MANUAL: {
            std::unordered_set<TrustEntry> one;
            TrustEntry e = digest::normalize(src.ref);
            if (!e.empty()) one.insert(e);
            rep->entries = one.size();
            return one;
        }
        case SourceKind::NOTE:
            if (!docs_) {
                err = "no document store for note source";
                break;
            }
            try {
                body = docs_->read_text(note_document_path(src.ref));
                ok = true;
            } catch (const std::exception& e) {
                err = e.what();
            }
            break;
        case SourceKind::EXTERNAL_FILE:
            ok = read_file(src.ref, &body, &err);
            break;
    }

    if (!ok) {
        rep->ok = false;
        rep->error = err;
        std::cerr << "[warn] trust source unavailable (" << source_kind_name(src.kind)
                  << " " << src.ref << "): " << err << "\n";
        return {};
    }

    auto entries = parse_trust_lines(body);
    rep->entries = entries.size();
    return entries;
}

std::shared_ptr<const TrustSnapshot> TrustStore::refresh() {
    std::lock_guard<std::mutex> serial(refresh_mu_);

    std::vector<TrustEntry> manual;
    std::vector<TrustSource> sources;
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        manual = manual_;
        sources = sources_;
    }

    std::unordered_set<TrustEntry> all;
    std::vector<SourceReport> report;
    report.reserve(manual.size() + sources.size());

    for (const auto& m : manual) {
        SourceReport rep;
        rep.source = TrustSource{SourceKind::MANUAL, m};
        auto got = read_source(rep.source, &rep);
        all.insert(got.begin(), got.end());
        report.push_back(std::move(rep));
    }
    for (const auto& s : sources) {
        SourceReport rep;
        rep.source = s;
        auto got = read_source(s, &rep);
        all.insert(got.begin(), got.end());
        report.push_back(std::move(rep));
    }

    std::shared_ptr<const TrustSnapshot> next;
    {
        std::lock_guard<std::mutex> lk(snap_mu_);
        next = std::make_shared<const TrustSnapshot>(std::move(all), ++generation_);
        snap_ = next;
        report_ = std::move(report);
    }
    std::cerr << "[trust] refreshed: " << next->size() << " trusted digest(s), generation "
              << next->generation() << "\n";
    return next;
}

std::shared_ptr<const TrustSnapshot> TrustStore::snapshot() const {
    std::lock_guard<std::mutex> lk(snap_mu_);
    return snap_;
}

bool TrustStore::contains(const std::string& entry) const {
    return snapshot()->contains(entry);
}

bool TrustStore::add_manual(const std::string& entry) {
    TrustEntry e = digest::normalize(entry);
    if (e.empty()) return false;
    std::lock_guard<std::mutex> lk(cfg_mu_);
    if (std::find(manual_.begin(), manual_.end(), e) != manual_.end()) return false;
    manual_.push_back(e);
    return true;
}

bool TrustStore::remove_manual(const std::string& entry) {
    TrustEntry e = digest::normalize(entry);
    std::lock_guard<std::mutex> lk(cfg_mu_);
    auto it = std::find(manual_.begin(), manual_.end(), e);
    if (it == manual_.end()) return false;
    manual_.erase(it);
    return true;
}

static TrustSource canonical_source(const TrustSource& s) {
    TrustSource c = s;
    if (c.kind == SourceKind::NOTE) c.ref = normalize_note_ref(c.ref);
    return c;
}

bool TrustStore::add_source(const TrustSource& source) {
    if (source.kind == SourceKind::MANUAL) return add_manual(source.ref);
    TrustSource c = canonical_source(source);
    if (c.ref.empty()) return false;
    std::lock_guard<std::mutex> lk(cfg_mu_);
    if (std::find(sources_.begin(), sources_.end(), c) != sources_.end()) return false;
    sources_.push_back(c);
    return true;
}

bool TrustStore::remove_source(const TrustSource& source) {
    if (source.kind == SourceKind::MANUAL) return remove_manual(source.ref);
    TrustSource c = canonical_source(source);
    std::lock_guard<std::mutex> lk(cfg_mu_);
    auto it = std::find(sources_.begin(), sources_.end(), c);
    if (it == sources_.end()) return false;
    sources_.erase(it);
    return true;
}

void TrustStore::replace_config(const std::vector<TrustEntry>& manual,
                                const std::vector<TrustSource>& sources) {
    {
        std::lock_guard<std::mutex> lk(cfg_mu_);
        manual_.clear();
        sources_.clear();
    }
    for (const auto& m : manual) add_manual(m);
    for (const auto& s : sources) add_source(s);
}

std::vector<TrustEntry> TrustStore::manual_entries() const {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    return manual_;
}

std::vector<TrustSource> TrustStore::sources() const {
    std::lock_guard<std::mutex> lk(cfg_mu_);
    return sources_;
}

std::vector<SourceReport> TrustStore::last_report() const {
    std::lock_guard<std::mutex> lk(snap_mu_);
    return report_;
}

} // namespace scriptgate
