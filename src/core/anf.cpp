#include "anf.h"
#include "parallel.h"

const char* anf_status_str(AnfStatus s){
    switch (s){
        case AnfStatus::Ok:                   return "ok";
        case AnfStatus::OutOfDomain:          return "rule value must be less than 2^(2^n)";
        case AnfStatus::InsufficientCapacity: return "integer type has fewer than 2^n bits";
        case AnfStatus::InvalidLength:        return "truth table length must be a power of two";
        case AnfStatus::InvalidArgument:      return "number of variables must be non-negative";
    }
    return "unknown status";
}

namespace {

// Lower index of pair j in a pass with the given blocksize (a power of two).
//
// Inserts a zero bit at position log2(blocksize) into j, so j = 0..2^(n-1)-1 enumerates every (source+i) of the pass exactly once and the
// partner is always (source+i) + blocksize.
inline std::size_t pair_lower(std::size_t j, std::size_t blocksize){
    return ((j & ~(blocksize - 1)) << 1) | (j & (blocksize - 1));
}

inline bool use_parallel(int n){
    return anf_parallel_enabled() && n >= anf_parallel_min_vars();
}

// Run f(j) for j in [0, count), on the parallel backend if requested.
template <typename F>
inline void for_each_index(bool parallel, std::size_t count, F f){
    if (parallel){
        anf_par_for(0, count, f);
        return;
    }
    for (std::size_t j = 0; j < count; ++j) f(j);
}

// Masks selecting the source bits of the in-word passes: bit p is set iff bit k of p is 0.
constexpr uint64_t kSourceMask[6] = {
    0x5555555555555555ull,
    0x3333333333333333ull,
    0x0F0F0F0F0F0F0F0Full,
    0x00FF00FF00FF00FFull,
    0x0000FFFF0000FFFFull,
    0x00000000FFFFFFFFull,
};

} // namespace

void anf_transform_array(bool* table, std::size_t len){
    if (len == 0) return;
    const int n = log2_exact(len);
    const std::size_t N = std::size_t(1) << n;

    if (use_parallel(n)){
        // Pairs of one pass are disjoint, so they can be updated concurrently.  Passes stay sequential.
        const std::size_t half = N >> 1;
        for (std::size_t blocksize = 1; blocksize < N; blocksize <<= 1){
            for_each_index(true, half, [table, blocksize](std::size_t j){
                const std::size_t s = pair_lower(j, blocksize);
                table[s + blocksize] ^= table[s];
            });
        }
        return;
    }

    for (std::size_t blocksize = 1; blocksize < N; blocksize <<= 1){
        for (std::size_t source = 0; source < N; source += (blocksize << 1)){
            const std::size_t target = source + blocksize;
            for (std::size_t i = 0; i < blocksize; ++i)
                table[target + i] ^= table[source + i];
        }
    }
}

AnfStatus anf_transform_array_checked(bool* table, std::size_t len){
    if (!is_pow2(len)) return AnfStatus::InvalidLength;
    anf_transform_array(table, len);
    return AnfStatus::Ok;
}

void anf_transform_bitvec(BitVec& table){
    if (table.nbits <= 0) return;
    const int n = log2_exact((std::size_t)table.nbits);
    const bool par = use_parallel(n);
    uint64_t* w = table.w.data();
    const std::size_t M = table.w.size();

    // blocksize 1..32: both halves of every block live in the same word.
    for (int k = 0; k < n && k < 6; ++k){
        const uint64_t mask = kSourceMask[k];
        const int shift = 1 << k;
        for_each_index(par, M, [w, mask, shift](std::size_t j){
            w[j] ^= (w[j] & mask) << shift;
        });
    }

    // blocksize >= 64: whole words, blocksize / 64 words per half block.
    for (int k = 6; k < n; ++k){
        const std::size_t bw = std::size_t(1) << (k - 6);
        for_each_index(par, M >> 1, [w, bw](std::size_t j){
            const std::size_t s = pair_lower(j, bw);
            w[s + bw] ^= w[s];
        });
    }
}

AnfStatus anf_transform_bitvec_checked(BitVec& table){
    if (table.nbits <= 0 || !is_pow2((std::size_t)table.nbits)) return AnfStatus::InvalidLength;
    anf_transform_bitvec(table);
    return AnfStatus::Ok;
}
