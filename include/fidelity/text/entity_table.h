#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace fidelity::text {

// Named character references (HTML 4 set) that XML parsers do not resolve on
// their own, mapped to the equivalent decimal numeric reference:
//   "eacute" -> "&#233;"
// The five reserved XML entities are deliberately absent. They stay symbolic
// so the text still re-parses correctly.
//
// Built once on first use and never modified afterwards, so concurrent
// lookups need no locking.
class EntityTable {
public:
    static const EntityTable& instance();

    // name excludes the leading '&' and trailing ';'
    std::optional<std::string_view> lookup(std::string_view name) const;
    bool contains(std::string_view name) const { return entries_.count(name) != 0; }
    size_t size() const { return entries_.size(); }

    template<typename Fn>
    void for_each(Fn&& fn) const {
        for (auto& [name, reference] : entries_) {
            fn(name, reference);
        }
    }

private:
    EntityTable();

    std::unordered_map<std::string_view, std::string_view> entries_;
};

// quot, amp, lt, gt, apos
bool is_reserved_entity(std::string_view name);

} // namespace fidelity::text
