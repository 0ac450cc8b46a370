#ifndef FAST_ANF_TRUTH_TABLE_H
#define FAST_ANF_TRUTH_TABLE_H

#pragma once
#include <algorithm>
#include <vector>
#include <cstdint>
#include "anf.h"
#include "bitops.h"

// Conversions between the truth-table encodings accepted by the transforms.
//
// All encodings share the same index space: entry i is f(i), with bit b of i the value of x_b.  A table for n variables has 2^n entries.

// Unpack the low 2^n bits of `value` into a boolean table.  Requires 2^n <= bit width of U.
template <typename U>
std::vector<bool> truth_table_from_packed(U value, int n){
    const int N = 1 << n;
    std::vector<bool> t(N);
    for (int i = 0; i < N; ++i) t[i] = test_bit(value, i);
    return t;
}

// Pack a boolean table into U.  Entries beyond the bit width of U are ignored.
template <typename U>
U packed_from_truth_table(const std::vector<bool>& table){
    constexpr int W = bit_width_of<U>();
    U out = U(0);
    const int N = (int)std::min<std::size_t>(table.size(), (std::size_t)W);
    for (int i = 0; i < N; ++i)
        if (table[i]) out = assign_bit(out, i, true);
    return out;
}

inline BitVec bitvec_from_truth_table(const std::vector<bool>& table){
    BitVec b((int)table.size());
    for (int i = 0; i < b.nbits; ++i) if (table[i]) b.set1(i);
    return b;
}

inline std::vector<bool> truth_table_from_bitvec(const BitVec& b){
    std::vector<bool> t(b.nbits);
    for (int i = 0; i < b.nbits; ++i) t[i] = b.get(i);
    return t;
}

// Truth table of n <= 6 variables packed in a uint64_t, as a 2^n-bit BitVec.
inline BitVec bitvec_from_u64(uint64_t value, int n){
    BitVec b(1 << n);
    const uint64_t keep = (n >= 6) ? ~0ull : ((1ull << (1 << n)) - 1);
    b.w[0] = value & keep;
    return b;
}

// Truth table of n variables given as ceil(2^n / 8) little-endian bytes (the layout of BitVec::to_bytes_le()).
//
// Fails with InvalidLength if the byte count is wrong and with OutOfDomain if the last byte has bits set at or above position 2^n,
// the same condition the packed transform rejects.  `out` is written only on AnfStatus::Ok.
inline AnfStatus bitvec_from_bytes_checked(const std::vector<uint8_t>& bytes, int n, BitVec& out){
    if (n < 0) return AnfStatus::InvalidArgument;
    if (n > 30) return AnfStatus::InsufficientCapacity;   // BitVec indexes bits with int
    const int N = 1 << n;
    if (bytes.size() != (std::size_t)((N + 7) >> 3)) return AnfStatus::InvalidLength;
    if ((N & 7) != 0 && (bytes.back() >> (N & 7)) != 0) return AnfStatus::OutOfDomain;
    out = BitVec::from_bytes_le(bytes, N);
    return AnfStatus::Ok;
}

#endif //FAST_ANF_TRUTH_TABLE_H
