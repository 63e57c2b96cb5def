// json-c access for the client configuration.
// JsonDoc owns a parsed tree; JsonView walks it without ownership; models
// derive from JsonInterface and fill themselves from the root view.

#pragma once

#include <json-c/json.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "scene_snapshot.h"

class JsonDoc {
public:
    JsonDoc() = default;
    explicit JsonDoc(json_object* root) : root_(root) {}
    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;
    JsonDoc(JsonDoc&& o) noexcept : root_(o.root_) { o.root_ = nullptr; }
    ~JsonDoc() { release(); }

    static JsonDoc parse_file(const char* path, std::string* err) {
        json_object* root = json_object_from_file(path);
        if (!root && err) {
            const char* why = json_util_get_last_err();
            *err = std::string(path ? path : "<null>") + ": " + (why ? why : "unreadable json");
        }
        return JsonDoc(root);
    }

    static JsonDoc parse_text(const std::string& text, std::string* err) {
        json_tokener* tok = json_tokener_new();
        if (!tok) { if (err) *err = "out of memory"; return JsonDoc(); }
        json_object* root = json_tokener_parse_ex(tok, text.c_str(), -1);
        json_tokener_error jerr = json_tokener_get_error(tok);
        json_tokener_free(tok);
        if (!root && err) *err = std::string("json text: ") + json_tokener_error_desc(jerr);
        return JsonDoc(root);
    }

    json_object* root() const { return root_; }
    explicit operator bool() const { return root_ != nullptr; }

private:
    void release() { if (root_) json_object_put(root_); root_ = nullptr; }

    json_object* root_ = nullptr;
};

struct JsonView {
    json_object* node = nullptr;

    JsonView() = default;
    explicit JsonView(json_object* n) : node(n) {}

    json_type type() const { return node ? json_object_get_type(node) : json_type_null; }
    bool is_object() const { return type() == json_type_object; }
    bool is_array() const { return type() == json_type_array; }
    bool is_number() const { return type() == json_type_int || type() == json_type_double; }

    // Empty view when the key is absent or this is not an object.
    JsonView member(const char* key) const {
        json_object* v = nullptr;
        if (is_object() && json_object_object_get_ex(node, key, &v)) return JsonView(v);
        return JsonView();
    }
    bool get_view(const char* key, JsonView& out) const {
        out = member(key);
        return out.node != nullptr;
    }

    size_t size() const { return is_array() ? json_object_array_length(node) : 0; }
    JsonView at(size_t i) const { return i < size() ? JsonView(json_object_array_get_idx(node, i)) : JsonView(); }

    // Typed reads. A value of the wrong JSON type reads as absent so a
    // config typo keeps the default instead of turning into 0.
    bool read(std::string& out) const {
        if (type() != json_type_string) return false;
        out = json_object_get_string(node);
        return true;
    }
    bool read(double& out) const {
        if (!is_number()) return false;
        out = json_object_get_double(node);
        return true;
    }
    bool read(int& out) const {
        if (!is_number()) return false;
        out = json_object_get_int(node);
        return true;
    }
    bool read(uint32_t& out) const {
        if (!is_number()) return false;
        int64_t v = json_object_get_int64(node);
        if (v < 0 || v > (int64_t)UINT32_MAX) return false;
        out = (uint32_t)v;
        return true;
    }
};

class JsonInterface {
public:
    virtual ~JsonInterface() = default;
    virtual bool from_json(const JsonView& root, std::string* err) = 0;

    template <typename T>
    static bool load_file(const char* path, T& model, std::string* err = nullptr) {
        static_assert(std::is_base_of<JsonInterface, T>::value, "model must derive from JsonInterface");
        JsonDoc doc = JsonDoc::parse_file(path, err);
        return doc && static_cast<JsonInterface&>(model).from_json(JsonView(doc.root()), err);
    }

    template <typename T>
    static bool load_string(const std::string& text, T& model, std::string* err = nullptr) {
        static_assert(std::is_base_of<JsonInterface, T>::value, "model must derive from JsonInterface");
        JsonDoc doc = JsonDoc::parse_text(text, err);
        return doc && static_cast<JsonInterface&>(model).from_json(JsonView(doc.root()), err);
    }
};

// get_json_value(view, "key", &field): overwrites field only when the key
// is present with a usable type.
template <typename T>
inline bool get_json_value(const JsonView& view, const char* key, T* out) {
    if (!out) return false;
    T tmp{};
    if (!view.member(key).read(tmp)) return false;
    *out = tmp;
    return true;
}

// [r,g,b] or [r,g,b,a], channels clamped to 0..255.
inline bool get_json_rgba(const JsonView& view, const char* key, Rgb* out, uint8_t* alpha = nullptr) {
    JsonView arr = view.member(key);
    if (!out || arr.size() < 3) return false;
    uint8_t ch[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < arr.size() && i < 4; ++i) {
        int c = 0;
        if (!arr.at(i).read(c)) return false;
        ch[i] = (uint8_t)(c < 0 ? 0 : (c > 255 ? 255 : c));
    }
    out->r = ch[0]; out->g = ch[1]; out->b = ch[2];
    if (alpha && arr.size() >= 4) *alpha = ch[3];
    return true;
}
