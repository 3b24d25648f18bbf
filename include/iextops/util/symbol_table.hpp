/*
    IexTops Symbol Interning

    Maps ticker text to dense 32-bit ids so decoded records can carry a
    handle instead of an owned string. Lookups use Abseil flat_hash_map
    (Swiss Tables); the table is shared by every decoder thread, so access
    is guarded by a reader/writer lock and the hot path (already interned
    symbol) takes the shared side only.

    Interned text lives for the lifetime of the table; ids are never reused.
*/

#pragma once

#include <absl/container/flat_hash_map.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace iex::util {

class SymbolTable {
public:
    using Id = uint32_t;

    SymbolTable() = default;
    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

    /// Process-wide table used by InternedSymbol
    [[nodiscard]] static SymbolTable& global() {
        static SymbolTable table;
        return table;
    }

    /// Return the id for text, adding it on first sight
    [[nodiscard]] Id intern(std::string_view text) {
        {
            std::shared_lock lock{mutex_};
            if (auto it = index_.find(text); it != index_.end()) [[likely]] {
                return it->second;
            }
        }

        std::unique_lock lock{mutex_};
        // Another writer may have won the race between the two locks
        if (auto it = index_.find(text); it != index_.end()) {
            return it->second;
        }
        const auto id = static_cast<Id>(names_.size());
        const std::string& stored = names_.emplace_back(text);
        index_.emplace(std::string_view{stored}, id);
        return id;
    }

    [[nodiscard]] std::optional<Id> find(std::string_view text) const {
        std::shared_lock lock{mutex_};
        if (auto it = index_.find(text); it != index_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// Text for an id; empty view for ids this table never issued
    [[nodiscard]] std::string_view resolve(Id id) const {
        std::shared_lock lock{mutex_};
        if (id < names_.size()) [[likely]] {
            return names_[id];
        }
        return {};
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock{mutex_};
        return names_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    absl::flat_hash_map<std::string_view, Id> index_;  // keys view into names_
    std::deque<std::string> names_;                    // deque keeps element addresses stable
};

} // namespace iex::util
