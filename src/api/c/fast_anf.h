#ifndef FAST_ANF_H
#define FAST_ANF_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif


#define FAST_ANF_VERSION_MAJOR 0
#define FAST_ANF_VERSION_MINOR 1
#define FAST_ANF_VERSION_PATCH 0

// Status codes, same order as AnfStatus.
#define FAST_ANF_OK                     0
#define FAST_ANF_OUT_OF_DOMAIN          1
#define FAST_ANF_INSUFFICIENT_CAPACITY  2
#define FAST_ANF_INVALID_LENGTH         3
#define FAST_ANF_INVALID_ARGUMENT       4


const char* fast_anf_version(void);

const char* fast_anf_status_str(int status);


// Checked ANF transform of a truth table of n variables packed into an unsigned integer.
// On FAST_ANF_OK the coefficient table is stored in *out, otherwise *out is left untouched.
int fast_anf_transform_u8(uint8_t value, int n, uint8_t* out);
int fast_anf_transform_u16(uint16_t value, int n, uint16_t* out);
int fast_anf_transform_u32(uint32_t value, int n, uint32_t* out);
int fast_anf_transform_u64(uint64_t value, int n, uint64_t* out);

// Checked in-place ANF transform of table[0..len).  The table is not modified unless the result is FAST_ANF_OK.
int fast_anf_transform_bool_array(bool* table, size_t len);


#ifdef __cplusplus
}
#endif

#endif
