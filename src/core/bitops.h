#ifndef FAST_ANF_BITOPS_H
#define FAST_ANF_BITOPS_H

#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <bit>
#include <limits>

// Lightweight bit utilities.
//
// BitVec is a simple dynamically-sized bitset backed by a std::vector<uint64_t>.
// Bits are numbered from 0 to nbits-1.  Bit i lives in word w[i>>6] at position (i & 63).  All operations assume little-endian word ordering.
//
// Truth tables of length 2^n use this layout directly: bit i is the value of the function on the input whose binary encoding is i (LSB = x_0).

struct BitVec {
    int nbits;                  // number of meaningful bits
    std::vector<uint64_t> w;    // storage (ceil(nbits / 64) words)

    BitVec(): nbits(0) {}

    explicit BitVec(int n): nbits(n), w((n+63)>>6, 0ull) {}

    // Construct a BitVec from a little-endian byte array.
    //
    // bytes[0] contains bits 0..7, bytes[1] contains bits 8..15, etc.
    // Only the first `nbits` bits are read (extra bits are ignored, missing bytes read as zero).
    static BitVec from_bytes_le(const std::vector<uint8_t>& bytes, int nbits){
        BitVec b(nbits);
        for (int i=0;i<nbits;i++){
            int byte = i>>3;
            int bit  = i & 7;
            if (byte < (int)bytes.size() && ((bytes[byte]>>bit)&1))
                b.set1(i);
        }
        return b;
    }

    // Export as a little-endian byte array of ceil(nbits / 8) bytes, same layout as from_bytes_le().
    std::vector<uint8_t> to_bytes_le() const {
        std::vector<uint8_t> out((nbits+7)>>3, 0);
        for (int i=0;i<nbits;i++){
            if (get(i)) out[i>>3] |= (1u<<(i&7));
        }
        return out;
    }

    inline bool get(int i) const { return (w[i>>6] >> (i&63)) & 1ull; }
    inline void set1(int i){ w[i>>6] |= (1ull<<(i&63)); }

    // Hamming weight (number of 1 bits) of this vector.
    int weight() const {
        int s=0;
        for (uint64_t x : w) s += std::popcount(x);
        return s;
    }

    bool operator==(const BitVec& other) const {
        return nbits == other.nbits && w == other.w;
    }
};


// Word-level helpers

// Number of value bits of an unsigned integer type.
template <typename U>
constexpr int bit_width_of(){
    static_assert(std::numeric_limits<U>::is_integer && !std::numeric_limits<U>::is_signed,
                  "truth tables are packed into unsigned integer types");
    return std::numeric_limits<U>::digits;
}

// Test bit `pos` of x.
template <typename U>
inline bool test_bit(U x, int pos){ return ((x >> pos) & U(1)) != U(0); }

// Set bit `pos` of x to `value`, leaving the other bits unchanged.
template <typename U>
inline U assign_bit(U x, int pos, bool value){
    const U m = U(U(1) << pos);
    return value ? U(x | m) : U(x & U(~m));
}

// True iff len is an exact power of two (0 is not).
inline bool is_pow2(std::size_t len){ return std::has_single_bit(len); }

// log2 of a power of two, i.e. the number of variables of a table of that length.
inline int log2_exact(std::size_t len){ return std::countr_zero(len); }

#endif //FAST_ANF_BITOPS_H
