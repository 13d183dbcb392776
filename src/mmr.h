#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "json.h"
#include "sha256.h"

namespace cchain {

// Merkle Mountain Range over 32-byte leaf digests.
//
// Hashing is domain separated:
//   leaf = SHA256(0x00 || leaf_digest)
//   node = SHA256(0x01 || left || right)
// Peaks of equal height merge on append. The root bags the peaks right to
// left: bag = peak[n-1]; bag = node(peak[i], bag) for i = n-2 .. 0.
// An empty range has size 0 and root "".

enum class MmrError {
    NONE = 0,
    MALFORMED_LEAF,       // not exactly 64 hex characters
    INDEX_OUT_OF_RANGE,
    EMPTY,
};

const char* mmr_error_name(MmrError e);

struct MmrPeak {
    uint32_t    height;   // mountain of 2^height leaves
    std::string hash;     // 64 lowercase hex

    bool operator==(const MmrPeak& o) const { return height == o.height && hash == o.hash; }
};

enum class PathSide : uint8_t { LEFT, RIGHT };

struct MmrPathStep {
    PathSide    side;     // which side the sibling sits on
    std::string hash;
};

struct MmrInclusionProof {
    uint64_t                 size{0};
    std::string              root;
    uint64_t                 leaf_index{0};
    std::string              leaf_digest;   // the appended leaf (e.g. a receipt next_root)
    std::string              leaf_hash;     // SHA256(0x00 || leaf_digest)
    uint64_t                 peak_index{0};
    uint32_t                 peak_height{0};
    std::vector<MmrPathStep> path;          // bottom-up siblings inside the mountain
    std::vector<MmrPeak>     peaks;
};

Hash256 mmr_leaf_hash(const Hash256& leaf_digest);
Hash256 mmr_node_hash(const Hash256& left, const Hash256& right);

// Bag peak hashes; "" for no peaks. Returns false on a malformed peak hash.
bool mmr_bag_peaks(const std::vector<MmrPeak>& peaks, std::string& root);

// Batch construction from the full ordered leaf list.
bool mmr_root_from_leaves(const std::vector<std::string>& leaves_hex,
                          std::string& root,
                          std::vector<MmrPeak>* peaks = nullptr,
                          std::string* err = nullptr);

// Stateless check of a proof against the root it carries.
bool mmr_verify_inclusion_proof(const MmrInclusionProof& proof);

JNode mmr_proof_to_json(const MmrInclusionProof& proof);
bool mmr_proof_from_json(const JNode& n, MmrInclusionProof& out, std::string* err = nullptr);

class MerkleMountainRange {
public:
    // Rejects malformed leaves without touching any state.
    bool append(const std::string& leaf_hex, std::string* err = nullptr, MmrError* code = nullptr);

    uint64_t size() const { return leaf_digests_.size(); }
    bool empty() const { return leaf_digests_.empty(); }
    std::string root() const;
    std::vector<MmrPeak> peaks() const;
    // Appended leaves in order, lowercase hex. This is the persisted form.
    std::vector<std::string> leaves() const;

    // Cost is proportional to the containing mountain, not the whole range.
    bool build_inclusion_proof(uint64_t index, MmrInclusionProof& out,
                               std::string* err = nullptr, MmrError* code = nullptr) const;
    // Requires proof.root to equal this range's current root.
    bool verify_inclusion_proof(const MmrInclusionProof& proof) const;

    // Replays a persisted leaf list.
    static std::optional<MerkleMountainRange> from_leaves(const std::vector<std::string>& leaves_hex,
                                                          std::string* err = nullptr);

private:
    struct Peak {
        uint32_t height;
        Hash256  hash;
    };

    std::vector<Hash256> leaf_digests_;
    std::vector<Hash256> leaf_hashes_;
    std::vector<Peak>    peak_stack_;
};

} // namespace cchain
