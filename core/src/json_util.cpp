#include "scriptgate/json_util.h"

#include <algorithm>
#include <sstream>

namespace scriptgate {

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = json_object_get_string(v);
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const int n = (int)json_object_array_length(v);
    out.reserve((size_t)n);
    for (int i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.push_back(json_object_get_string(it));
    }
    return out;
}

std::map<std::string, bool> json_get_bool_map(json_object* o, const char* k) {
    std::map<std::string, bool> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_object)) return out;
    json_object_object_foreach(v, key, val) {
        if (!key || !val || !json_object_is_type(val, json_type_boolean)) continue;
        out[key] = json_object_get_boolean(val) != 0;
    }
    return out;
}

json_object* json_new_string_array(const std::vector<std::string>& v) {
    json_object* arr = json_object_new_array();
    for (const auto& s : v) {
        json_object_array_add(arr, json_object_new_string_len(s.c_str(), (int)s.size()));
    }
    return arr;
}

std::string json_fields(const std::vector<std::pair<std::string, std::string>>& fields) {
    json_object* o = json_object_new_object();
    for (const auto& kv : fields) {
        json_object_object_add(o, kv.first.c_str(),
                               json_object_new_string_len(kv.second.c_str(), (int)kv.second.size()));
    }
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        int len = (int)json_object_array_length(obj);
        for (int i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string json_canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

} // namespace scriptgate
