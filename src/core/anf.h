#ifndef FAST_ANF_ANF_H
#define FAST_ANF_ANF_H

#pragma once
#include <cstddef>
#include <cstdint>
#include "bitops.h"

// ANF transform engine
//
// A Boolean function f : {0,1}^n -> {0,1} can be written in its algebraic normal form (ANF)
//
//   f(x) = ⊕_mask a[mask] * ∏_{i : mask_i = 1} x_i , where ⊕ is XOR over F2, and each "mask" is an n‑bit index that selects which variables appear in the monomial.
//
// Every entry point below takes a truth table (entry i is the value of f on the input whose binary encoding is i, LSB = x_0) and turns it into the
// table of coefficients a[mask] in the same index space and the same storage shape.  The conversion is the in-place butterfly (Möbius transform on
// the Boolean cube over F2):
//
//   for blocksize = 1, 2, 4, ..., 2^(n-1):
//     for source = 0, 2*blocksize, 4*blocksize, ... < 2^n:
//       target = source + blocksize
//       t[target+i] ^= t[source+i]   for i in [0, blocksize)
//
// The transform is an involution: applying it to a coefficient table gives back the truth table.
//
// Each representation has a checked entry point returning an AnfStatus, which validates everything before touching any output, and an unchecked
// fast path which skips validation and has undefined behaviour on invalid input.

enum class AnfStatus {
    Ok = 0,
    OutOfDomain,            // packed value has bits set at or above position 2^n
    InsufficientCapacity,   // packed type has fewer than 2^n bits
    InvalidLength,          // table length is not a power of two
    InvalidArgument         // negative number of variables
};

// Human readable name of a status, never null.
const char* anf_status_str(AnfStatus s);


// Packed representation

// Validate a packed truth table for n variables without transforming it.
//
// The capacity check runs first so that 2^(2^n) is never formed for a type that cannot hold it.
template <typename U>
AnfStatus anf_check_packed(U rule_value, int num_variables){
    constexpr int W = bit_width_of<U>();
    if (num_variables < 0) return AnfStatus::InvalidArgument;
    if (num_variables >= 31 || (1 << num_variables) > W) return AnfStatus::InsufficientCapacity;
    const int N = 1 << num_variables;
    if (N < W && (rule_value >> N) != U(0)) return AnfStatus::OutOfDomain;
    return AnfStatus::Ok;
}

// Unchecked ANF transform of a truth table packed into an unsigned integer.
//
// Input:
//   rule_value    - bit i is f(i); must be < 2^(2^n).
//   num_variables - n; U must have at least 2^n bits.
//
// Output:
//   The coefficient table, packed the same way.
template <typename U>
U anf_transform_packed(U rule_value, int num_variables){
    const int N = 1 << num_variables;
    U f = rule_value;
    for (int blocksize = 1; blocksize < N; blocksize <<= 1){
        for (int source = 0; source < N; source += (blocksize << 1)){
            const int target = source + blocksize;
            for (int i = 0; i < blocksize; ++i){
                const bool v = test_bit(f, target + i) ^ test_bit(f, source + i);
                f = assign_bit(f, target + i, v);
            }
        }
    }
    return f;
}

// Checked ANF transform of a packed truth table.  `out` is written only when the result is AnfStatus::Ok.
template <typename U>
AnfStatus anf_transform_packed_checked(U rule_value, int num_variables, U& out){
    const AnfStatus st = anf_check_packed(rule_value, num_variables);
    if (st != AnfStatus::Ok) return st;
    out = anf_transform_packed(rule_value, num_variables);
    return AnfStatus::Ok;
}


// Explicit boolean array

// Unchecked in-place transform of table[0..len).  len must be a power of two.
//
// Large tables (n >= ANF_PAR_MIN_VARS) split each pass across the parallel backend, see parallel.h.
void anf_transform_array(bool* table, std::size_t len);

// Checked in-place transform.  Returns InvalidLength without touching the table if len is not a power of two.
AnfStatus anf_transform_array_checked(bool* table, std::size_t len);

// Unchecked in-place transform of any random-access sequence of booleans (std::vector<bool>, std::array<bool,N>, std::vector<uint8_t> of 0/1 ...).
//
// Always serial: elements of a generic sequence may share storage (std::vector<bool>), so concurrent writes are not safe.
template <typename Seq>
void anf_transform_array(Seq& table){
    const std::size_t len = table.size();
    if (len == 0) return;
    const std::size_t N = std::size_t(1) << log2_exact(len);
    for (std::size_t blocksize = 1; blocksize < N; blocksize <<= 1){
        for (std::size_t source = 0; source < N; source += (blocksize << 1)){
            const std::size_t target = source + blocksize;
            for (std::size_t i = 0; i < blocksize; ++i){
                const bool v = bool(table[target + i]) != bool(table[source + i]);
                table[target + i] = v;
            }
        }
    }
}

template <typename Seq>
AnfStatus anf_transform_array_checked(Seq& table){
    if (!is_pow2(table.size())) return AnfStatus::InvalidLength;
    anf_transform_array(table);
    return AnfStatus::Ok;
}


// Multi-word bit vector

// Unchecked in-place transform of a BitVec holding a truth table of table.nbits = 2^n bits.
//
// Passes with blocksize < 64 are done inside each 64-bit word with shift-and-mask, larger passes XOR whole words.
void anf_transform_bitvec(BitVec& table);

// Checked in-place transform.  Returns InvalidLength without touching the table if nbits is not a power of two.
AnfStatus anf_transform_bitvec_checked(BitVec& table);

#endif //FAST_ANF_ANF_H
