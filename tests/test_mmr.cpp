// Merkle Mountain Range: construction, roots and inclusion proofs
#include "mmr.h"
#include "hex.h"
#include "log.h"
#include "sha256.h"
#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (line %d)\n", msg, __LINE__); \
        return 1; \
    } \
} while(0)

using namespace cchain;

// Deterministic distinct leaves
static std::string leaf(uint32_t i){
    uint8_t b[4] = {(uint8_t)(i >> 24), (uint8_t)(i >> 16), (uint8_t)(i >> 8), (uint8_t)i};
    return to_hex(sha256(b, sizeof(b)));
}

static Hash256 h(const std::string& hex){
    Hash256 out{};
    hex_to_hash(hex, out);
    return out;
}

int main(){
    log_init(LogLevel::ERR);
    printf("Testing MMR...\n");

    // Empty range
    {
        MerkleMountainRange m;
        TEST_CHECK(m.size() == 0, "empty size");
        TEST_CHECK(m.root().empty(), "empty root is the empty string");
        TEST_CHECK(m.peaks().empty(), "no peaks");
        MmrInclusionProof p;
        MmrError code = MmrError::NONE;
        TEST_CHECK(!m.build_inclusion_proof(0, p, nullptr, &code), "no proof from empty range");
        TEST_CHECK(code == MmrError::EMPTY, "code is EMPTY");
        std::string root = "x";
        TEST_CHECK(mmr_root_from_leaves({}, root) && root.empty(), "batch root of nothing");
        printf("  [PASS] Empty range\n");
    }

    // Hand-computed small roots
    {
        const std::string a = leaf(0), b = leaf(1), c = leaf(2);
        Hash256 la = mmr_leaf_hash(h(a)), lb = mmr_leaf_hash(h(b)), lc = mmr_leaf_hash(h(c));

        MerkleMountainRange m;
        TEST_CHECK(m.append(a), "append a");
        TEST_CHECK(m.root() == to_hex(la), "one leaf: root is the leaf hash");

        TEST_CHECK(m.append(b), "append b");
        Hash256 ab = mmr_node_hash(la, lb);
        TEST_CHECK(m.root() == to_hex(ab), "two leaves merge into one peak");
        TEST_CHECK(m.peaks().size() == 1 && m.peaks()[0].height == 1, "single height-1 peak");

        TEST_CHECK(m.append(c), "append c");
        TEST_CHECK(m.peaks().size() == 2, "three leaves: two peaks");
        TEST_CHECK(m.root() == to_hex(mmr_node_hash(ab, lc)), "bagging node(left, right)");

        // Leaf and node hashing are domain separated
        Hash256 x = h(a);
        TEST_CHECK(mmr_leaf_hash(x) != sha256(x.data(), x.size()), "leaf hash is prefixed");
        printf("  [PASS] Small roots\n");
    }

    // Right-to-left bagging with three peaks (7 leaves: heights 2,1,0)
    {
        std::vector<std::string> ls;
        for(uint32_t i = 0; i < 7; ++i) ls.push_back(leaf(i));
        MerkleMountainRange m;
        for(const auto& l : ls) TEST_CHECK(m.append(l), "append");
        auto pk = m.peaks();
        TEST_CHECK(pk.size() == 3, "three peaks");
        TEST_CHECK(pk[0].height == 2 && pk[1].height == 1 && pk[2].height == 0, "peak heights tallest first");
        Hash256 bag = mmr_node_hash(h(pk[1].hash), h(pk[2].hash));
        bag = mmr_node_hash(h(pk[0].hash), bag);
        TEST_CHECK(m.root() == to_hex(bag), "root = node(p0, node(p1, p2))");
        printf("  [PASS] Right-to-left bagging\n");
    }

    // Batch and incremental construction agree for every size
    {
        std::vector<std::string> ls;
        MerkleMountainRange m;
        for(uint32_t n = 1; n <= 70; ++n){
            ls.push_back(leaf(n));
            TEST_CHECK(m.append(ls.back()), "append");
            std::string batch;
            std::vector<MmrPeak> bpk;
            TEST_CHECK(mmr_root_from_leaves(ls, batch, &bpk), "batch build");
            TEST_CHECK(batch == m.root(), "batch root == incremental root");
            TEST_CHECK(bpk == m.peaks(), "batch peaks == incremental peaks");
            TEST_CHECK(m.size() == n, "size tracks appends");

            auto replay = MerkleMountainRange::from_leaves(m.leaves());
            TEST_CHECK(replay && replay->root() == m.root() && replay->size() == m.size(), "replay from leaves");
        }
        printf("  [PASS] Batch/incremental equivalence\n");
    }

    // Malformed leaves are rejected without mutation
    {
        MerkleMountainRange m;
        TEST_CHECK(m.append(leaf(1)), "append");
        const std::string root = m.root();
        const char* bad[] = {"", "abc", "zz", nullptr};
        for(size_t i = 0; bad[i]; ++i){
            MmrError code = MmrError::NONE;
            TEST_CHECK(!m.append(bad[i], nullptr, &code), "short leaf rejected");
            TEST_CHECK(code == MmrError::MALFORMED_LEAF, "code is MALFORMED_LEAF");
        }
        std::string err;
        TEST_CHECK(!m.append(std::string(63, 'a'), &err), "odd length rejected");
        TEST_CHECK(!err.empty(), "error text filled");
        TEST_CHECK(!m.append(std::string(66, 'a')), "too long rejected, not truncated");
        TEST_CHECK(!m.append(std::string(63, 'a') + "x"), "non-hex rejected");
        TEST_CHECK(!m.append(" " + std::string(63, 'a')), "whitespace rejected");
        TEST_CHECK(m.size() == 1 && m.root() == root, "state untouched by rejections");

        std::string r;
        TEST_CHECK(!mmr_root_from_leaves({leaf(1), "nothex"}, r), "batch rejects malformed leaf");
        TEST_CHECK(!MerkleMountainRange::from_leaves({leaf(1), "nothex"}), "replay rejects malformed leaf");
        printf("  [PASS] Malformed leaves\n");
    }

    // Uppercase input is normalized
    {
        std::string up = leaf(9);
        for(auto& c : up) c = (char)toupper((unsigned char)c);
        MerkleMountainRange a, b;
        TEST_CHECK(a.append(up) && b.append(leaf(9)), "append both cases");
        TEST_CHECK(a.root() == b.root(), "case does not affect root");
        TEST_CHECK(a.leaves()[0] == leaf(9), "stored lowercase");
        printf("  [PASS] Lowercase normalization\n");
    }

    // Every proof verifies, for every size up to 33
    {
        MerkleMountainRange m;
        for(uint32_t n = 1; n <= 33; ++n){
            TEST_CHECK(m.append(leaf(100 + n)), "append");
            for(uint64_t i = 0; i < n; ++i){
                MmrInclusionProof p;
                TEST_CHECK(m.build_inclusion_proof(i, p), "build proof");
                TEST_CHECK(p.size == n && p.leaf_index == i, "proof header");
                TEST_CHECK(p.root == m.root(), "proof root");
                TEST_CHECK(p.leaf_digest == leaf(100 + (uint32_t)i + 1), "proof leaf digest");
                TEST_CHECK(p.path.size() == p.peak_height, "path length equals mountain height");
                TEST_CHECK(mmr_verify_inclusion_proof(p), "stateless verify");
                TEST_CHECK(m.verify_inclusion_proof(p), "verify against range");
            }
        }
        MmrInclusionProof p;
        MmrError code = MmrError::NONE;
        TEST_CHECK(!m.build_inclusion_proof(m.size(), p, nullptr, &code), "index == size rejected");
        TEST_CHECK(code == MmrError::INDEX_OUT_OF_RANGE, "code is INDEX_OUT_OF_RANGE");
        printf("  [PASS] Inclusion proofs\n");
    }

    // Tampering
    {
        MerkleMountainRange m;
        for(uint32_t i = 0; i < 11; ++i) m.append(leaf(i));
        MmrInclusionProof good;
        TEST_CHECK(m.build_inclusion_proof(4, good), "build");
        TEST_CHECK(mmr_verify_inclusion_proof(good), "baseline verifies");

        MmrInclusionProof p = good;
        p.path[0].hash = leaf(999);
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "tampered sibling hash");

        p = good;
        p.path[1].side = p.path[1].side == PathSide::LEFT ? PathSide::RIGHT : PathSide::LEFT;
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "flipped side");

        p = good;
        p.leaf_digest = leaf(5);
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "swapped leaf");

        p = good;
        p.root = std::string(64, '0');
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "wrong root");

        p = good;
        p.leaf_index = 5;
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "wrong index");

        p = good;
        p.peaks[1].hash = leaf(7);
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "tampered other peak");

        p = good;
        p.size = 12;
        TEST_CHECK(!mmr_verify_inclusion_proof(p), "wrong size");

        // A proof for an older root does not verify against the grown range
        m.append(leaf(50));
        TEST_CHECK(mmr_verify_inclusion_proof(good), "old proof still self-consistent");
        TEST_CHECK(!m.verify_inclusion_proof(good), "old proof rejected by current range");
        printf("  [PASS] Tamper detection\n");
    }

    // JSON form of a proof
    {
        MerkleMountainRange m;
        for(uint32_t i = 0; i < 6; ++i) m.append(leaf(i));
        MmrInclusionProof p;
        TEST_CHECK(m.build_inclusion_proof(2, p), "build");
        JNode j = mmr_proof_to_json(p);
        JNode parsed;
        TEST_CHECK(json_parse(json_dump(j), parsed), "proof json parses");
        MmrInclusionProof q;
        TEST_CHECK(mmr_proof_from_json(parsed, q), "proof json loads");
        TEST_CHECK(m.verify_inclusion_proof(q), "loaded proof verifies");

        JNode bad;
        TEST_CHECK(json_parse("{\"size\":6}", bad), "parse");
        std::string err;
        TEST_CHECK(!mmr_proof_from_json(bad, q, &err) && !err.empty(), "incomplete proof rejected");
        printf("  [PASS] Proof JSON\n");
    }

    printf("All MMR tests passed!\n");
    return 0;
}
