#pragma once

#include <json-c/json.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace scriptgate {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);
std::map<std::string, bool> json_get_bool_map(json_object* o, const char* k);

json_object* json_new_string_array(const std::vector<std::string>& v);

// Flat object of string fields, serialized plain. Handy for audit payloads.
std::string json_fields(const std::vector<std::pair<std::string, std::string>>& fields);

// Recursively serialize with sorted object keys. Deterministic output for
// hashing.
std::string json_canonical(json_object* obj);

} // namespace scriptgate
