#include <resolvit/common/digest.hpp>
#include <resolvit/common/log.hpp>
#include <resolvit/proof/trie.hpp>

namespace resolvit::proof {

    namespace {
        bool pathBit(const std::vector<uint8_t> &path, size_t depth) {
            return (path[depth / 8] >> (7 - (depth % 8))) & 0x01;
        }
    } // namespace

    std::vector<uint8_t> SparseMerkleChecker::leafDigest(const std::vector<uint8_t> &state_key,
                                                         const std::optional<std::string> &value) {
        if (!value) {
            return std::vector<uint8_t>(DIGEST_SIZE, 0);
        }
        std::vector<uint8_t> buf;
        buf.reserve(1 + state_key.size() + value->size());
        buf.push_back(0x00);
        buf.insert(buf.end(), state_key.begin(), state_key.end());
        buf.insert(buf.end(), value->begin(), value->end());
        return sha256(buf);
    }

    std::vector<uint8_t> SparseMerkleChecker::combine(const std::vector<uint8_t> &left,
                                                      const std::vector<uint8_t> &right) {
        std::vector<uint8_t> buf;
        buf.reserve(1 + left.size() + right.size());
        buf.push_back(0x01);
        buf.insert(buf.end(), left.begin(), left.end());
        buf.insert(buf.end(), right.begin(), right.end());
        return sha256(buf);
    }

    std::vector<uint8_t> SparseMerkleChecker::computeRoot(const std::vector<uint8_t> &state_key,
                                                          const std::optional<std::string> &value,
                                                          const std::vector<std::vector<uint8_t>> &siblings) {
        auto path = sha256(state_key);
        auto current = leafDigest(state_key, value);
        // siblings[0] pairs with the leaf at depth siblings.size() - 1
        for (size_t i = 0; i < siblings.size(); ++i) {
            size_t depth = siblings.size() - 1 - i;
            if (pathBit(path, depth))
                current = combine(siblings[i], current);
            else
                current = combine(current, siblings[i]);
        }
        return current;
    }

    bool SparseMerkleChecker::verify(const StateProofInput &input) const {
        if (input.root_hash.size() != DIGEST_SIZE) {
            log::warn("proof", "State root must be 32 bytes, got " + std::to_string(input.root_hash.size()));
            return false;
        }
        if (input.proof_nodes.empty() || input.proof_nodes.size() % DIGEST_SIZE != 0) {
            log::warn("proof", "Proof nodes are not a sequence of 32-byte digests");
            return false;
        }
        size_t depth = input.proof_nodes.size() / DIGEST_SIZE;
        if (depth > MAX_DEPTH) {
            log::warn("proof", "Proof deeper than the key space");
            return false;
        }

        std::vector<std::vector<uint8_t>> siblings;
        siblings.reserve(depth);
        for (size_t i = 0; i < depth; ++i) {
            auto begin = input.proof_nodes.begin() + static_cast<std::ptrdiff_t>(i * DIGEST_SIZE);
            siblings.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(DIGEST_SIZE));
        }

        try {
            return computeRoot(input.state_key, input.expected_value, siblings) == input.root_hash;
        } catch (const std::exception &e) {
            log::warn("proof", std::string("Proof hashing failed: ") + e.what());
            return false;
        }
    }

} // namespace resolvit::proof
