/**
 * @file atom_space.hpp
 * @brief In-memory knowledge store consumed by the reasoning engines
 */

#pragma once

#include <knowledge/atom.hpp>
#include <export.hpp>
#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Synod {

/**
 * @brief Holds atoms keyed by id and answers exact pattern queries.
 *
 * Reads take a shared lock, writes an exclusive one. Unknown ids never
 * throw: update/remove simply report false.
 */
class SYNOD_API AtomSpace {
public:
    AtomSpace() = default;

    AtomSpace(const AtomSpace&) = delete;
    AtomSpace& operator=(const AtomSpace&) = delete;

    /**
     * @brief Insert or replace an atom; assigns "atom_<n>" when id is empty.
     * @return The stored atom's id
     */
    std::string add_atom(Atom atom);

    std::vector<Atom> query_atoms(const AtomPattern& pattern) const;

    bool remove_atom(const std::string& id);

    /**
     * @brief Merge a partial update into an existing atom. The id is preserved.
     */
    bool update_atom(const std::string& id, const AtomUpdate& update);

    std::optional<Atom> get_atom(const std::string& id) const;

    size_t size() const;
    void clear();

private:
    std::string next_id();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Atom> atoms_;
    std::vector<std::string> order_;            // Insertion order for stable query results
    std::atomic<uint64_t> next_id_{1};
};

} // namespace Synod
