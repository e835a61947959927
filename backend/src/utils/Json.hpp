#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace ft::json {

class Document {
public:
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() {
    if (doc_) {
      yyjson_doc_free(doc_);
    }
  }

  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  yyjson_doc *doc_ = nullptr;
};

// Owns a yyjson mutable document; serializers build into doc() and write().
class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
    }
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  yyjson_mut_doc *doc_ = nullptr;
};

// Field readers for request bodies. Missing or mistyped fields yield nullopt.
inline std::optional<std::string> string_field(yyjson_val *object,
                                               char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (!value || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<bool> bool_field(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (!value || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

} // namespace ft::json
