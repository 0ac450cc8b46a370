#ifndef FAST_ANF_PARALLEL_H
#define FAST_ANF_PARALLEL_H

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

// Global switch for parallel execution.
//
// If ANF_PARALLEL is unset, parallel execution is enabled by default wherever the library was compiled with TBB or OpenMP support.
//
// If ANF_PARALLEL is set to a string beginning with '0', 'f', 'F', 'n', or 'N', parallel execution is disabled and code runs single-threaded.
inline bool anf_parallel_enabled() {
    const char* v = std::getenv("ANF_PARALLEL");
    if (!v) return true;                       // default: parallel ON if compiled
    if (v[0]=='0' || v[0]=='f' || v[0]=='F' || v[0]=='n' || v[0]=='N') return false;
    return true;
}

// Smallest number of variables for which the in-place transforms split a pass across workers.
//
// Read from ANF_PAR_MIN_VARS (default 16).  Unparsable values fall back to the default.
inline int anf_parallel_min_vars() {
    constexpr int defv = 16;
    const char* s = std::getenv("ANF_PAR_MIN_VARS");
    if (!s) return defv;
    try { return std::max(0, std::stoi(s)); }
    catch (const std::exception&) { return defv; }
}

#if defined(FAST_ANF_HAVE_TBB)

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

// TBB-based parallel for wrapper.
//
// Calls f(i) for i in [begin, end).  If parallel execution is disabled or the range is too small, it falls back to a simple serial loop.
template <typename F>
inline void anf_par_for(std::size_t begin, std::size_t end, F f) {
    if (!anf_parallel_enabled() || end <= begin + 1) {
        for (std::size_t i=begin;i<end;++i) f(i);
        return;
    }
    tbb::parallel_for(tbb::blocked_range<std::size_t>(begin,end),
                      [&](const tbb::blocked_range<std::size_t>& r){
                          for (std::size_t i=r.begin(); i<r.end(); ++i) f(i);
                      });
}

#elif defined(FAST_ANF_HAVE_OPENMP)

#include <omp.h>

// OpenMP-based parallel for wrapper.
//
// Static schedule: every index of a butterfly pass updates one disjoint pair (a table entry or a word), so iterations cost the same
// and an even split per thread balances without the per-chunk dispatch of schedule(dynamic).
template <typename F>
inline void anf_par_for(std::size_t begin, std::size_t end, F f) {
    if (!anf_parallel_enabled() || end <= begin + 1) {
        for (std::size_t i=begin;i<end;++i) f(i);
        return;
    }
#pragma omp parallel for schedule(static)
    for (long long i=(long long)begin; i<(long long)end; ++i) {
        f((std::size_t)i);
    }
}

#else

// Fallback: no parallel backend, always run serially.
template <typename F>
inline void anf_par_for(std::size_t begin, std::size_t end, F f) {
    for (std::size_t i=begin;i<end;++i) f(i);
}

#endif

#endif //FAST_ANF_PARALLEL_H
