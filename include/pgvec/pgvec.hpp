#pragma once

/** \file pgvec.hpp
 *  \brief Umbrella header: vector kinds, wire codecs and the registration adapter.
 */

#include "pgvec/error.hpp"
#include "pgvec/config.hpp"
#include "pgvec/vector/vector_kind.hpp"
#include "pgvec/vector/dense_vector.hpp"
#include "pgvec/vector/sparse_vector.hpp"
#include "pgvec/vector/any_vector.hpp"
#include "pgvec/vector/float_base64.hpp"
#include "pgvec/codec/codec_adapter.hpp"
