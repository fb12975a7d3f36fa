#include <jb/errors.hpp>
#include <jb/vocabulary.hpp>

namespace jb {

  property_kind
  kind_of(const property_def& def) {
    return std::visit([](const auto& d) { return d.kind; }, def);
  }

  const std::string&
  value_type_of(const property_def& def) {
    return std::visit(
        [](const auto& d) -> const std::string& { return d.value_type; }, def);
  }

  std::string
  tag_of(const std::string& name, const property_def& def) {
    auto tag = std::visit([](const auto& d) { return d.tag; }, def);
    return tag ? *tag : name;
  }

  const property_def*
  type_def::find_property(const std::string& name) const {
    for (const auto& [property_name, def] : properties_) {
      if (property_name == name) return &def;
    }
    return nullptr;
  }

  void
  vocabulary::add(type_def type) {
    if (index_.count(type.name()) > 0)
      throw schema_error::malformed(type.name(), "duplicate type definition");
    index_.emplace(type.name(), types_.size());
    types_.push_back(std::move(type));
    resolved_ = false;
  }

  namespace {

    enum class visit_state { unvisited, in_progress, done };

    void
    check_acyclic(const vocabulary& vocab, const type_def& type,
                  std::unordered_map<std::string, visit_state>& state) {
      auto& current = state[type.name()];
      if (current == visit_state::done) return;
      if (current == visit_state::in_progress)
        throw schema_error::cyclic_inheritance(type.name());
      current = visit_state::in_progress;
      for (const auto& super : type.extends())
        check_acyclic(vocab, vocab.get(super), state);
      state[type.name()] = visit_state::done;
    }

  } // namespace

  void
  vocabulary::resolve() {
    for (const auto& type : types_) {
      for (const auto& super : type.extends()) {
        if (index_.count(super) == 0)
          throw schema_error::unknown_supertype(type.name(), super);
      }
    }

    std::unordered_map<std::string, visit_state> state;
    for (const auto& type : types_)
      check_acyclic(*this, type, state);

    resolved_ = true;
  }

  const type_def*
  vocabulary::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &types_[it->second];
  }

  const type_def&
  vocabulary::get(const std::string& name) const {
    if (const auto* type = find(name)) return *type;
    throw schema_error::malformed(name, "no such type");
  }

} // namespace jb
