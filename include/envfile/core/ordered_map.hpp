#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace envfile {

/// Insertion-ordered map.
///
/// Iteration follows the order in which keys were first inserted. Assigning
/// to an existing key replaces its value in place without moving it, which
/// gives "last value wins, first position kept" semantics for documents
/// that define the same key more than once.
template <typename K, typename V>
class OrderedMap {
public:
    using value_type = std::pair<K, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    /// Insert or overwrite `key`. Returns true when the key was new.
    auto set(K key, V value) -> bool {
        if (auto it = index_.find(key); it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::move(key), std::move(value));
        return true;
    }

    [[nodiscard]] auto find(const K& key) const -> const V* {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        return &entries_[it->second].second;
    }

    [[nodiscard]] auto contains(const K& key) const -> bool {
        return index_.contains(key);
    }

    [[nodiscard]] auto get(const K& key) const -> std::optional<V> {
        if (const auto* v = find(key)) return *v;
        return std::nullopt;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

    friend auto operator==(const OrderedMap& a, const OrderedMap& b) -> bool {
        return a.entries_ == b.entries_;
    }

private:
    std::vector<value_type> entries_;
    std::unordered_map<K, std::size_t> index_;
};

/// Resolved document: name -> value, `nullopt` for a bare name.
using ValueMap = OrderedMap<std::string, std::optional<std::string>>;

} // namespace envfile
