#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resolvit::proof {

    /// Everything a trie walk needs, already decoded from the reply envelope
    struct StateProofInput {
        std::vector<uint8_t> root_hash;            // state root the reply claims
        std::vector<uint8_t> state_key;            // trie path of the record
        std::optional<std::string> expected_value; // encoded state value, nullopt proves absence
        std::vector<uint8_t> proof_nodes;          // raw proof node bytes
    };

    /// Recomputes a state root from proof nodes and compares it with the claimed root.
    /// Implementations must not throw; malformed nodes are a failed proof.
    class TrieProofChecker {
      public:
        virtual ~TrieProofChecker() = default;
        virtual bool verify(const StateProofInput &input) const = 0;
    };

    /// Sparse Merkle proof over SHA-256(state_key).
    /// proof_nodes: concatenated 32-byte sibling digests, leaf level first.
    /// leaf = H(0x00 || key || value), absent leaf = 32 zero bytes, inner = H(0x01 || left || right).
    /// The sibling at depth d sits on the side opposite to bit d (MSB first) of H(key).
    class SparseMerkleChecker : public TrieProofChecker {
      public:
        static constexpr size_t DIGEST_SIZE = 32;
        static constexpr size_t MAX_DEPTH = 256;

        bool verify(const StateProofInput &input) const override;

        /// Root implied by a leaf and its sibling path
        static std::vector<uint8_t> computeRoot(const std::vector<uint8_t> &state_key,
                                                const std::optional<std::string> &value,
                                                const std::vector<std::vector<uint8_t>> &siblings);

        static std::vector<uint8_t> leafDigest(const std::vector<uint8_t> &state_key,
                                               const std::optional<std::string> &value);

        static std::vector<uint8_t> combine(const std::vector<uint8_t> &left, const std::vector<uint8_t> &right);
    };

} // namespace resolvit::proof
