#include "pactforge/pact_file.h"
#include "pactforge/body_builder.h"
#include "pactforge/json_mini.h"
#include "pactforge/serialization.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace pactforge {

void add_interaction(PactFile& pact, Interaction interaction) {
    if (interaction.description.empty()) {
        throw std::runtime_error("PactFile: interaction description is empty");
    }
    for (const auto& i : pact.interactions) {
        if (i.description == interaction.description) {
            throw std::runtime_error("PactFile: duplicate interaction: " + interaction.description);
        }
    }
    pact.interactions.push_back(std::move(interaction));
}

static std::string file_part(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == ' ') out.push_back('_');
        else out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string pact_file_name(const PactFile& pact) {
    return file_part(pact.consumer) + "-" + file_part(pact.provider) + ".json";
}

static json_object* headers_to_json(const std::map<std::string, std::string>& headers) {
    json_object* o = json_object_new_object();
    for (const auto& [k, v] : headers) {
        json_object_object_add(o, k.c_str(), json_object_new_string_len(v.data(), static_cast<int>(v.size())));
    }
    return o;
}

static void add_body(json_object* target, const std::optional<Node>& body) {
    if (!body) return;
    PactBody built = build_pact_body(*body);
    json_object_object_add(target, "body", node_to_json(built.body));
    if (!built.matching_rules.empty()) {
        json_object_object_add(target, "matchingRules", rules_to_json(built.matching_rules));
    }
}

static json_object* party(const std::string& name) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "name", json_object_new_string(name.c_str()));
    return o;
}

json_object* pact_file_to_json(const PactFile& pact) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "consumer", party(pact.consumer));
    json_object_object_add(root, "provider", party(pact.provider));

    json_object* arr = json_object_new_array();
    for (const auto& it : pact.interactions) {
        json_object* io = json_object_new_object();
        json_object_object_add(io, "description", json_object_new_string(it.description.c_str()));
        if (!it.provider_state.empty()) {
            json_object_object_add(io, "providerState", json_object_new_string(it.provider_state.c_str()));
        }

        json_object* req = json_object_new_object();
        json_object_object_add(req, "method", json_object_new_string(it.request.method.c_str()));
        json_object_object_add(req, "path", json_object_new_string(it.request.path.c_str()));
        if (!it.request.query.empty()) {
            json_object_object_add(req, "query", json_object_new_string(it.request.query.c_str()));
        }
        if (!it.request.headers.empty()) {
            json_object_object_add(req, "headers", headers_to_json(it.request.headers));
        }
        add_body(req, it.request.body);
        json_object_object_add(io, "request", req);

        json_object* resp = json_object_new_object();
        json_object_object_add(resp, "status", json_object_new_int(it.response.status));
        if (!it.response.headers.empty()) {
            json_object_object_add(resp, "headers", headers_to_json(it.response.headers));
        }
        add_body(resp, it.response.body);
        json_object_object_add(io, "response", resp);

        json_object_array_add(arr, io);
    }
    json_object_object_add(root, "interactions", arr);

    json_object* meta = json_object_new_object();
    json_object_object_add(meta, "pactSpecificationVersion", json_object_new_string(pact.spec_version.c_str()));
    json_object_object_add(root, "metadata", meta);
    return root;
}

std::string pact_file_to_string(const PactFile& pact, bool pretty) {
    json_object* o = pact_file_to_json(pact);
    std::string s = to_json_string(o, pretty);
    json_object_put(o);
    return s;
}

std::string write_pact_file(const PactFile& pact, const std::string& dir,
                            const Settings& settings, std::string* err) {
    if (pact.consumer.empty() || pact.provider.empty()) {
        if (err) *err = "pact needs both consumer and provider names";
        return "";
    }

    std::error_code ec;
    std::filesystem::path d = dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir);
    std::filesystem::create_directories(d, ec);
    if (ec) {
        if (err) *err = "create_directories: " + ec.message();
        return "";
    }

    const std::filesystem::path dst = d / pact_file_name(pact);
    if (!settings.overwrite && std::filesystem::exists(dst, ec)) {
        if (err) *err = "pact file exists and overwrite is disabled: " + dst.string();
        return "";
    }

    std::string body = pact_file_to_string(pact, settings.pretty);
    body.push_back('\n');

    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!f) {
            if (err) *err = "cannot write: " + tmp.string();
            return "";
        }
        f << body;
        if (!f) {
            if (err) *err = "write failed: " + tmp.string();
            return "";
        }
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        if (err) *err = "rename failed: " + ec.message();
        return "";
    }
    return dst.string();
}

// --- request loading ---

static bool fail(std::string* err, const std::string& msg) {
    if (err) *err = "malformed document: " + msg;
    return false;
}

static bool read_headers(json_object* o, const std::string& where,
                         std::map<std::string, std::string>* out, std::string* err) {
    json_object* h = nullptr;
    if (!json_object_object_get_ex(o, "headers", &h)) return true;
    if (!json_object_is_type(h, json_type_object)) return fail(err, where + ".headers: expected object");
    json_object_object_foreach(h, k, v) {
        if (!json_object_is_type(v, json_type_string)) {
            return fail(err, where + ".headers." + k + ": expected string");
        }
        (*out)[k] = json_object_get_string(v);
    }
    return true;
}

static bool read_body(json_object* o, const std::string& where,
                      std::optional<Node>* out, std::string* err) {
    json_object* b = nullptr;
    if (!json_object_object_get_ex(o, "body", &b)) return true;
    Node n;
    std::string derr;
    if (!node_from_json(b, &n, &derr)) return fail(err, where + ".body: " + derr);
    *out = std::move(n);
    return true;
}

static bool read_interaction(json_object* o, const std::string& where,
                             Interaction* out, std::string* err) {
    auto desc = json_mini::get_string(o, "description");
    if (!desc) return fail(err, where + ".description: expected string");
    out->description = *desc;
    out->provider_state = json_mini::get_string(o, "providerState").value_or("");

    json_object* req = nullptr;
    if (json_object_object_get_ex(o, "request", &req)) {
        if (!json_object_is_type(req, json_type_object)) return fail(err, where + ".request: expected object");
        const std::string rw = where + ".request";
        if (auto m = json_mini::get_string(req, "method")) out->request.method = *m;
        if (auto p = json_mini::get_string(req, "path")) out->request.path = *p;
        if (auto q = json_mini::get_string(req, "query")) out->request.query = *q;
        if (!read_headers(req, rw, &out->request.headers, err)) return false;
        if (!read_body(req, rw, &out->request.body, err)) return false;
    }

    json_object* resp = nullptr;
    if (json_object_object_get_ex(o, "response", &resp)) {
        if (!json_object_is_type(resp, json_type_object)) return fail(err, where + ".response: expected object");
        const std::string rw = where + ".response";
        json_object* st = nullptr;
        if (json_object_object_get_ex(resp, "status", &st)) {
            if (!json_object_is_type(st, json_type_int)) return fail(err, rw + ".status: expected integer");
            const int64_t s = json_object_get_int64(st);
            if (s < 100 || s > 599) return fail(err, rw + ".status: out of range");
            out->response.status = static_cast<int>(s);
        }
        if (!read_headers(resp, rw, &out->response.headers, err)) return false;
        if (!read_body(resp, rw, &out->response.body, err)) return false;
    }
    return true;
}

bool load_pact_request(const std::string& text, PactFile* out, std::string* err) {
    std::string perr;
    json_mini::Doc doc = json_mini::parse(text, &perr);
    if (!doc) return fail(err, perr);
    if (!json_object_is_type(doc.root, json_type_object)) return fail(err, "root: expected object");

    PactFile pact;
    auto consumer = json_mini::get_string(doc.root, "consumer");
    auto provider = json_mini::get_string(doc.root, "provider");
    if (!consumer || consumer->empty()) return fail(err, "consumer: expected non-empty string");
    if (!provider || provider->empty()) return fail(err, "provider: expected non-empty string");
    pact.consumer = *consumer;
    pact.provider = *provider;

    json_object* arr = json_mini::get_array(doc.root, "interactions");
    if (!arr) return fail(err, "interactions: expected array");
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        const std::string where = "interactions[" + std::to_string(i) + "]";
        if (!el || !json_object_is_type(el, json_type_object)) return fail(err, where + ": expected object");
        Interaction it;
        if (!read_interaction(el, where, &it, err)) return false;
        try {
            add_interaction(pact, std::move(it));
        } catch (const std::runtime_error& e) {
            return fail(err, where + ": " + e.what());
        }
    }

    *out = std::move(pact);
    return true;
}

} // namespace pactforge
