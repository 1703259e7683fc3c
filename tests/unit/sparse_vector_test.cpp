#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "pgvec/vector/sparse_vector.hpp"
#include "pgvec/wire/byte_order.hpp"
#include "tests/support/codec_test_helpers.hpp"

using pgvec::SparseDecodeOptions;
using pgvec::SparseVector;
using pgvec::core::error_code;
using Bytes = std::vector<std::uint8_t>;

namespace {

Bytes sparse_wire(std::int32_t dim, std::int32_t nnz, const std::vector<std::int32_t>& idx,
                  const std::vector<float>& vals) {
  Bytes out(12);
  pgvec::wire::store_be_i32(out.data(), dim);
  pgvec::wire::store_be_i32(out.data() + 4, nnz);
  pgvec::wire::store_be_i32(out.data() + 8, 0);
  const auto i = pgvec::wire::pack_be_i32(idx);
  const auto v = pgvec::wire::pack_be_f32(vals);
  out.insert(out.end(), i.begin(), i.end());
  out.insert(out.end(), v.begin(), v.end());
  return out;
}

} // namespace

TEST_CASE("sparse elision keeps non-zero positions", "[sparse]") {
  const std::vector<double> v{0.0, 3.5, 0.0, -2.0};
  auto s = SparseVector::from_float_list(v);
  REQUIRE(s.has_value());
  REQUIRE(s->nnz() == 2);
  REQUIRE(s->size() == 4);
  REQUIRE(s->index_at(0) == 1);
  REQUIRE(s->index_at(1) == 3);
  REQUIRE(s->value_at(0) == 3.5f);
  REQUIRE(s->to_float_list() == v);
}

TEST_CASE("sparse wire layout", "[sparse][wire]") {
  auto s = SparseVector::from_float_list(std::vector<double>{0.0, 3.5, 0.0, -2.0});
  REQUIRE(s.has_value());
  REQUIRE(s->to_database_binary() == Bytes{0, 0, 0, 4,  0, 0, 0, 2,  0, 0, 0, 0,
                                           0, 0, 0, 1,  0, 0, 0, 3,
                                           0x40, 0x60, 0, 0,  0xC0, 0x00, 0, 0});
}

TEST_CASE("empty sparse vector", "[sparse]") {
  SparseVector s;
  REQUIRE(s.size() == 0);
  REQUIRE(s.nnz() == 0);
  REQUIRE(s.to_float_list().empty());
  REQUIRE(s.to_database_binary() == Bytes(12, 0));

  // all zeros keeps the dimension but stores nothing; -0.0 counts as zero
  auto zeros = SparseVector::from_float_list(std::vector<double>{0.0, -0.0, 0.0});
  REQUIRE(zeros.has_value());
  REQUIRE(zeros->size() == 3);
  REQUIRE(zeros->nnz() == 0);
}

TEST_CASE("from_parts rejects mismatched entry counts", "[sparse][errors]") {
  const Bytes indices{0, 0, 0, 0, 0, 0, 0, 1};
  const Bytes values{0x3F, 0x80, 0, 0};
  auto r = SparseVector::from_parts(4, indices, values);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::format_error);
  REQUIRE(r.error().component == "vector.sparse");

  auto ok = SparseVector::from_parts(4, Bytes{0, 0, 0, 2}, values);
  REQUIRE(ok.has_value());
  REQUIRE(ok->to_float_list() == std::vector<double>{0.0, 0.0, 1.0, 0.0});
}

TEST_CASE("sparse round trips", "[sparse][wire]") {
  const auto v = test_support::random_sparse(1536, 5);
  auto s = SparseVector::from_float_list(v);
  REQUIRE(s.has_value());
  REQUIRE(s->to_float_list() == v);

  auto decoded = SparseVector::from_database_binary(s->to_database_binary());
  REQUIRE(decoded.has_value());
  REQUIRE(*decoded == *s);
}

TEST_CASE("sparse decode validates lengths", "[sparse][errors]") {
  SECTION("short header") {
    auto r = SparseVector::from_database_binary(Bytes(11, 0));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::format_error);
  }
  SECTION("nnz larger than the body") {
    auto wire = sparse_wire(8, 3, {1, 2}, {1.0f, 2.0f});
    auto r = SparseVector::from_database_binary(wire);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::format_error);
  }
  SECTION("trailing bytes") {
    auto wire = sparse_wire(8, 2, {1, 2}, {1.0f, 2.0f});
    wire.push_back(0);
    wire.push_back(0);
    auto r = SparseVector::from_database_binary(wire);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::format_error);
  }
  SECTION("negative nnz") {
    auto r = SparseVector::from_database_binary(sparse_wire(8, -1, {}, {}));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::format_error);
  }
  SECTION("index outside the dimension") {
    auto r = SparseVector::from_database_binary(sparse_wire(4, 1, {4}, {1.0f}));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::format_error);
    auto neg = SparseVector::from_database_binary(sparse_wire(4, 1, {-1}, {1.0f}));
    REQUIRE_FALSE(neg.has_value());
  }
}

TEST_CASE("reserved sparse header field is ignored", "[sparse][wire]") {
  auto wire = sparse_wire(3, 1, {2}, {5.0f});
  wire[11] = 0x7F;
  auto r = SparseVector::from_database_binary(wire);
  REQUIRE(r.has_value());
  REQUIRE(r->to_float_list() == std::vector<double>{0.0, 0.0, 5.0});
  REQUIRE(r->to_database_binary()[11] == 0);
}

TEST_CASE("unordered and duplicate indices decode with last write winning", "[sparse]") {
  const auto wire = sparse_wire(4, 3, {3, 1, 3}, {1.0f, 2.0f, 7.0f});
  auto r = SparseVector::from_database_binary(wire);
  REQUIRE(r.has_value());
  REQUIRE(r->nnz() == 3);
  REQUIRE(r->to_float_list() == std::vector<double>{0.0, 2.0, 0.0, 7.0});

  SparseDecodeOptions strict;
  strict.require_ascending_indices = true;
  auto s = SparseVector::from_database_binary(wire, strict);
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.error().code == error_code::format_error);

  auto ordered = SparseVector::from_database_binary(sparse_wire(4, 2, {0, 3}, {1.0f, 2.0f}), strict);
  REQUIRE(ordered.has_value());
}

TEST_CASE("sparse narrowing overflow is out_of_range", "[sparse][errors]") {
  auto r = SparseVector::from_float_list(std::vector<double>{0.0, 1e39});
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::out_of_range);
}

TEST_CASE("values that narrow to zero are elided", "[sparse][elision]") {
  auto r = SparseVector::from_float_list(std::vector<double>{0.0, 1e-50, 2.0, -1e-60});
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 4);
  REQUIRE(r->nnz() == 1);
  REQUIRE(r->index_at(0) == 2);
  REQUIRE(r->value_at(0) == 2.0f);
  REQUIRE(r->to_database_binary() == sparse_wire(4, 1, {2}, {2.0f}));
}

TEST_CASE("sparse dimension is bounded on decode", "[sparse][wire][errors]") {
  auto huge = SparseVector::from_database_binary(sparse_wire(0x7FFFFFFF, 0, {}, {}));
  REQUIRE_FALSE(huge.has_value());
  REQUIRE(huge.error().code == error_code::format_error);

  auto just_over = SparseVector::from_database_binary(
      sparse_wire(static_cast<std::int32_t>(SparseVector::max_dim) + 1, 1, {0}, {1.0f}));
  REQUIRE_FALSE(just_over.has_value());
  REQUIRE(just_over.error().code == error_code::format_error);

  auto at_limit = SparseVector::from_database_binary(
      sparse_wire(static_cast<std::int32_t>(SparseVector::max_dim), 1, {7}, {1.0f}));
  REQUIRE(at_limit.has_value());
  REQUIRE(at_limit->size() == SparseVector::max_dim);
  REQUIRE(at_limit->nnz() == 1);
}

TEST_CASE("sparse base64 import", "[sparse][base64]") {
  auto r = SparseVector::from_float_base64(test_support::native_float_base64({0.0f, 1.0f, 0.0f, -2.5f}));
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 4);
  REQUIRE(r->nnz() == 2);
  REQUIRE(r->to_float_list() == std::vector<double>{0.0, 1.0, 0.0, -2.5});
}

TEST_CASE("sparse display strings", "[sparse]") {
  auto s = SparseVector::from_float_list(test_support::random_sparse(1536, 9));
  REQUIRE(s.has_value());
  const auto compact = pgvec::to_string(*s);
  REQUIRE(compact.size() < 64);
  REQUIRE(compact.rfind("SparseVector(dim=1536, nnz=", 0) == 0);
  REQUIRE(pgvec::repr(*s).size() > 1000);
}
