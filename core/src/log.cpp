#include "pactforge/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace pactforge {

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

// Serializes with object keys sorted so equal records give equal lines.
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
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

std::string make_run_id() {
    const char* det = std::getenv("PACTFORGE_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        uint64_t r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

JsonlLogger::JsonlLogger(const LogHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::app) {
    if (hdr_.run_id.empty()) hdr_.run_id = make_run_id();
}

void JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    if (!out_) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));

    json_object* pobj = json_tokener_parse(payload_json.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_object_new_string(payload_json.c_str()));

    json_object_object_add(rec, "run_id", json_object_new_string(hdr_.run_id.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64(seq_++));
    json_object_object_add(rec, "tool", json_object_new_string(hdr_.tool.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    out_ << line.str() << "\n";
    out_.flush();
}

} // namespace pactforge
