#include "scriptgate/log.h"
#include "scriptgate/digest.h"
#include "scriptgate/json_util.h"

#include <json-c/json.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scriptgate {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Last chain_hash and seq of an existing audit file, if any.
static void resume_chain(const std::string& path, std::string* prev, uint64_t* seq) {
    std::ifstream in(path);
    if (!in) return;
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return;
    json_object* o = json_tokener_parse(last.c_str());
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (o) json_object_put(o);
        std::cerr << "[warn] audit log tail is not a JSON object, starting a new chain: " << path << "\n";
        return;
    }
    std::string h;
    if (json_get_string(o, "chain_hash", &h) && digest::is_sha256_hex(h)) *prev = h;
    json_object* v = nullptr;
    if (json_object_object_get_ex(o, "seq", &v) && json_object_is_type(v, json_type_int)) {
        *seq = (uint64_t)json_object_get_int64(v);
    }
    json_object_put(o);
}

AuditLog::AuditLog(const std::string& path) : path_(path) {
    resume_chain(path_, &chain_prev_, &seq_);
    out_.open(path_, std::ios::out | std::ios::app);
    enabled_ = (bool)out_;
    if (!enabled_) {
        std::cerr << "[warn] cannot open audit log: " << path_ << "\n";
    }
}

void AuditLog::event(const std::string& name, const std::string& payload_json) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lk(mu_);

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)(seq_ + 1)));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::string record = json_canonical(rec);
    std::string chain_hash = digest::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    json_object_object_add(rec, "chain_hash", json_object_new_string(chain_hash.c_str()));
    out_ << json_canonical(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
    seq_++;
}

bool verify_audit_chain(const std::string& path, size_t* lines, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open: " + path;
        return false;
    }
    std::string prev(64, '0');
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        n++;
        json_object* o = json_tokener_parse(line.c_str());
        if (!o || !json_object_is_type(o, json_type_object)) {
            if (o) json_object_put(o);
            if (err) *err = "line " + std::to_string(n) + ": not a JSON object";
            return false;
        }
        std::string stored_prev, stored_hash;
        json_get_string(o, "chain_prev", &stored_prev);
        json_get_string(o, "chain_hash", &stored_hash);
        json_object_object_del(o, "chain_prev");
        json_object_object_del(o, "chain_hash");
        std::string record = json_canonical(o);
        json_object_put(o);

        if (stored_prev != prev) {
            if (err) *err = "line " + std::to_string(n) + ": chain_prev does not match previous line";
            return false;
        }
        if (digest::sha256_hex(prev + record) != stored_hash) {
            if (err) *err = "line " + std::to_string(n) + ": chain_hash mismatch";
            return false;
        }
        prev = stored_hash;
        if (lines) *lines = n;
    }
    if (lines) *lines = n;
    return true;
}

} // namespace scriptgate
