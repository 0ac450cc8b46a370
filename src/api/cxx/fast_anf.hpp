#ifndef FAST_ANF_HPP
#define FAST_ANF_HPP

#include "../../core/bitops.h"

#include "../../core/anf.h"

#include "../../core/truth_table.h"

#include "../../core/parallel.h"

#endif
