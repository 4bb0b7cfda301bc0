#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace jsonv {

// Location of the value being decoded. Paths are chained on the stack, one
// frame per nesting level, and only rendered to text when a validation record
// is added. A child must not outlive its parent.
//
// Rendering: the root is "/", a property adds its name after a single '/',
// a sequence element adds "<index>/".
class path {
public:
  path() noexcept = default;

  path prop(std::string_view name) const noexcept { return path(this, segment::prop, name, 0); }
  path index(std::size_t i) const noexcept { return path(this, segment::index, {}, i); }

  bool is_root() const noexcept { return kind_ == segment::root; }

  std::string str() const {
    std::string out;
    render(out);
    return out;
  }

private:
  enum class segment { root, prop, index };

  path(const path* parent, segment kind, std::string_view name, std::size_t i) noexcept
      : parent_(parent), kind_(kind), name_(name), index_(i) {}

  void render(std::string& out) const {
    if (kind_ == segment::root) {
      out.push_back('/');
      return;
    }
    parent_->render(out);
    if (out.empty() || out.back() != '/') out.push_back('/');
    if (kind_ == segment::prop) {
      out.append(name_.data(), name_.size());
    } else {
      out += std::to_string(index_);
      out.push_back('/');
    }
  }

  const path* parent_{nullptr};
  segment kind_{segment::root};
  std::string_view name_;
  std::size_t index_{0};
};

} // namespace jsonv
