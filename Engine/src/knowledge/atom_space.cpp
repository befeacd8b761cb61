#include <knowledge/atom_space.hpp>
#include <algorithm>
#include <mutex>

namespace Synod {

std::string AtomSpace::next_id() {
    return "atom_" + std::to_string(next_id_.fetch_add(1));
}

std::string AtomSpace::add_atom(Atom atom) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (atom.id.empty()) {
        do {
            atom.id = next_id();
        } while (atoms_.count(atom.id));
    }

    std::string id = atom.id;
    auto [it, inserted] = atoms_.insert_or_assign(id, std::move(atom));
    if (inserted) order_.push_back(id);
    return id;
}

std::vector<Atom> AtomSpace::query_atoms(const AtomPattern& pattern) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Atom> results;
    for (const auto& id : order_) {
        const Atom& atom = atoms_.at(id);
        if (pattern.matches(atom)) results.push_back(atom);
    }
    return results;
}

bool AtomSpace::remove_atom(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (atoms_.erase(id) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

bool AtomSpace::update_atom(const std::string& id, const AtomUpdate& update) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = atoms_.find(id);
    if (it == atoms_.end()) return false;

    update.apply_to(it->second);
    it->second.id = id;
    return true;
}

std::optional<Atom> AtomSpace::get_atom(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = atoms_.find(id);
    if (it == atoms_.end()) return std::nullopt;
    return it->second;
}

size_t AtomSpace::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return atoms_.size();
}

void AtomSpace::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    atoms_.clear();
    order_.clear();
}

} // namespace Synod
