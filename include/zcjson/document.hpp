#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <zcjson/arena.hpp>
#include <zcjson/error.hpp>
#include <zcjson/parser.hpp>
#include <zcjson/value.hpp>

namespace zcjson {

// Owns the source text, the arena the tree is allocated from, and the root.
// Buffer and arena live on the heap so moving a document keeps every value
// valid. A moved-from document is empty and may be parsed into again.
class document {
public:
  document() = default;
  explicit document(std::string json) : buffer_(std::make_unique<std::string>(std::move(json))) {}

  document(const document&) = delete;
  document& operator=(const document&) = delete;

  document(document&& other) noexcept
      : buffer_(std::move(other.buffer_)), arena_(std::move(other.arena_)), root_(std::move(other.root_)) {
    other.root_ = value();
  }

  document& operator=(document&& other) noexcept {
    if (this == &other) return *this;
    // Release the tree while its arena is still alive.
    root_ = value();
    buffer_ = std::move(other.buffer_);
    arena_ = std::move(other.arena_);
    root_ = std::move(other.root_);
    other.root_ = value();
    return *this;
  }

  // Drops the tree; keeps buffer capacity and arena blocks for the next parse.
  void clear() noexcept {
    root_ = value();
    if (buffer_) buffer_->clear();
    if (arena_) arena_->clear();
  }

  void reserve_buffer(std::size_t n) { ensure_storage().first->reserve(n); }

  std::string_view source() const noexcept {
    if (!buffer_) return std::string_view{};
    return std::string_view(buffer_->data(), buffer_->size());
  }

  const value& root() const noexcept { return root_; }

  pmr::arena_resource& arena() { return *ensure_storage().second; }

  // Copies `json` in and parses it. `json` may point into source().
  error assign(std::string_view json, parse_options opt = {}) {
    root_ = value();
    ensure_storage().first->assign(json.data(), json.size());
    return parse_buffer(opt);
  }

  // Parses the text the document was constructed with.
  error parse_buffer(parse_options opt = {}) {
    root_ = value();
    if (arena_) arena_->clear();
    auto storage = ensure_storage();
    parser p(std::string_view(storage.first->data(), storage.first->size()), opt, storage.second);
    return p.run_into(root_);
  }

private:
  std::unique_ptr<std::string> buffer_;
  std::unique_ptr<pmr::arena_resource> arena_;
  // Declared last: destroyed before the arena it was allocated from.
  value root_;

  std::pair<std::string*, pmr::arena_resource*> ensure_storage() {
    if (!buffer_) buffer_ = std::make_unique<std::string>();
    if (!arena_) arena_ = std::make_unique<pmr::arena_resource>();
    return {buffer_.get(), arena_.get()};
  }
};

struct document_parse_result {
  document doc;
  error err;
};

// Copies `json` into `d` and parses it, reusing the document's buffer
// capacity and arena blocks.
inline error parse_into(document& d, std::string_view json, parse_options opt = {}) {
  return d.assign(json, opt);
}

// Takes ownership of `json`; the result does not reference caller memory.
inline document_parse_result parse_document(std::string json, parse_options opt = {}) {
  document_parse_result r{document(std::move(json)), error{}};
  r.err = r.doc.parse_buffer(opt);
  return r;
}

inline document parse_document_or_throw(std::string json, parse_options opt = {}) {
  auto r = parse_document(std::move(json), opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.doc);
}

} // namespace zcjson
