#include "fast_anf.h"
#include "anf.h"

#define FAST_ANF_STR2(x) #x
#define FAST_ANF_STR(x) FAST_ANF_STR2(x)

namespace {

template <typename U>
int transform_packed_c(U value, int n, U* out){
    if (!out) return FAST_ANF_INVALID_ARGUMENT;
    U r = 0;
    const AnfStatus st = anf_transform_packed_checked(value, n, r);
    if (st == AnfStatus::Ok) *out = r;
    return static_cast<int>(st);
}

} // namespace

extern "C" {

const char* fast_anf_version(void){
    return FAST_ANF_STR(FAST_ANF_VERSION_MAJOR) "."
           FAST_ANF_STR(FAST_ANF_VERSION_MINOR) "."
           FAST_ANF_STR(FAST_ANF_VERSION_PATCH);
}

const char* fast_anf_status_str(int status){
    if (status < FAST_ANF_OK || status > FAST_ANF_INVALID_ARGUMENT) return "unknown status";
    return anf_status_str(static_cast<AnfStatus>(status));
}

int fast_anf_transform_u8(uint8_t value, int n, uint8_t* out){ return transform_packed_c(value, n, out); }
int fast_anf_transform_u16(uint16_t value, int n, uint16_t* out){ return transform_packed_c(value, n, out); }
int fast_anf_transform_u32(uint32_t value, int n, uint32_t* out){ return transform_packed_c(value, n, out); }
int fast_anf_transform_u64(uint64_t value, int n, uint64_t* out){ return transform_packed_c(value, n, out); }

int fast_anf_transform_bool_array(bool* table, size_t len){
    if (!table && len != 0) return FAST_ANF_INVALID_ARGUMENT;
    return static_cast<int>(anf_transform_array_checked(table, len));
}

}
