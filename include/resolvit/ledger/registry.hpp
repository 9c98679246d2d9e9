#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <resolvit/ledger/pool.hpp>

namespace resolvit::ledger {

    /// Identity bound to a pool; replaced, never mutated, on reconfiguration
    struct LedgerDescriptor {
        std::string id;
        std::shared_ptr<LedgerPool> pool;
        bool is_production = true;
        bool is_write = false;
        std::optional<std::string> endorser_did;
        std::optional<std::string> endorser_alias;
        size_t index = 0; // position in the configured list
    };

    // ===========================================
    // LedgerRegistry - ordered production / non-production partitions
    // ===========================================

    /// Built once per configuration and then shared read-only. Lookups in flight keep
    /// their snapshot (and its pools) alive across a registry swap.
    class LedgerRegistry {
      public:
        LedgerRegistry() = default;

        /// Append in configured order
        inline void add(LedgerDescriptor descriptor) {
            descriptor.index = production_.size() + non_production_.size();
            if (descriptor.is_production) {
                production_.push_back(std::move(descriptor));
            } else {
                non_production_.push_back(std::move(descriptor));
            }
        }

        inline const std::vector<LedgerDescriptor> &production() const { return production_; }

        inline const std::vector<LedgerDescriptor> &nonProduction() const { return non_production_; }

        /// Production first, then non-production, each in configured order
        inline std::vector<LedgerDescriptor> all() const {
            std::vector<LedgerDescriptor> out(production_);
            out.insert(out.end(), non_production_.begin(), non_production_.end());
            return out;
        }

        inline const LedgerDescriptor *find(const std::string &id) const {
            for (const auto &d : production_) {
                if (d.id == id)
                    return &d;
            }
            for (const auto &d : non_production_) {
                if (d.id == id)
                    return &d;
            }
            return nullptr;
        }

        inline const LedgerDescriptor *findByPoolName(const std::string &pool_name) const {
            for (const auto &d : production_) {
                if (d.pool && d.pool->name() == pool_name)
                    return &d;
            }
            for (const auto &d : non_production_) {
                if (d.pool && d.pool->name() == pool_name)
                    return &d;
            }
            return nullptr;
        }

        inline bool contains(const std::string &id) const { return find(id) != nullptr; }

        inline size_t size() const { return production_.size() + non_production_.size(); }

        inline bool empty() const { return size() == 0; }

        inline const std::optional<std::string> &writeLedgerId() const { return write_ledger_id_; }

        inline void setWriteLedgerId(std::optional<std::string> id) { write_ledger_id_ = std::move(id); }

      private:
        std::vector<LedgerDescriptor> production_;
        std::vector<LedgerDescriptor> non_production_;
        std::optional<std::string> write_ledger_id_;
    };

} // namespace resolvit::ledger
