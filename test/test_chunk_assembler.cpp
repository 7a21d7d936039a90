#include "catch2/catch.hpp"

#include "stream/chunk_assembler.hpp"
#include "stream/errors.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using edge_stream::ChunkAssembler;
using edge_stream::MissingParametersError;

TEST_CASE("chunks are concatenated in arrival order") {
  ChunkAssembler assembler;
  assembler.observe(data("ab"));
  assembler.observe(data("cde"));
  assembler.observe(data("f"));
  assembler.observe(params(1, 2));

  auto req = assembler.finalize();
  REQUIRE(str(req.payload) == "abcdef");
  REQUIRE(req.params.has_value());
}

TEST_CASE("interleaved parameters do not disturb payload order") {
  ChunkAssembler assembler;
  assembler.observe(params(10, 20));
  assembler.observe(data("one,"));
  assembler.observe(params(30, 40));
  assembler.observe(data("two,"));
  assembler.observe(data("three"));

  auto req = assembler.finalize();
  REQUIRE(str(req.payload) == "one,two,three");
}

TEST_CASE("last parameters win") {
  ChunkAssembler assembler;
  assembler.observe(params(1, 2));
  assembler.observe(data("x"));
  assembler.observe(params(3, 4));

  REQUIRE(assembler.parameter_replacements() == 1);

  auto req = assembler.finalize();
  REQUIRE(req.params->min_threshold == 3);
  REQUIRE(req.params->max_threshold == 4);
}

TEST_CASE("readiness follows parameters, not data") {
  ChunkAssembler assembler;
  REQUIRE_FALSE(assembler.is_ready());

  assembler.observe(data("abc"));
  REQUIRE_FALSE(assembler.is_ready());

  assembler.observe(params(0, 0));
  REQUIRE(assembler.is_ready());

  // More data after readiness is still accepted.
  assembler.observe(data("def"));
  REQUIRE(assembler.buffered_bytes() == 6);
  REQUIRE(assembler.data_chunks_observed() == 2);
}

TEST_CASE("finalize without parameters fails") {
  ChunkAssembler assembler;
  assembler.observe(data("payload"));
  REQUIRE_THROWS_AS(assembler.finalize(), MissingParametersError);
}

TEST_CASE("parameters alone give an empty payload") {
  ChunkAssembler assembler;
  assembler.observe(params(50, 150));

  auto req = assembler.finalize();
  REQUIRE(req.payload.empty());
  REQUIRE(req.params->min_threshold == 50);
}

TEST_CASE("empty data chunks are legal") {
  ChunkAssembler assembler;
  assembler.observe(data(""));
  assembler.observe(data("a"));
  assembler.observe(data(""));
  assembler.observe(params(1, 1));

  REQUIRE(assembler.data_chunks_observed() == 3);
  REQUIRE(str(assembler.finalize().payload) == "a");
}

TEST_CASE("const and rvalue observe agree") {
  ChunkAssembler by_copy;
  ChunkAssembler by_move;

  const std::vector<Part> parts = {data("AAAA"), params(5, 6), data("BB"),
                                   data("C")};
  for (const auto &p : parts) {
    by_copy.observe(p);
    Part moved = p;
    by_move.observe(std::move(moved));
  }

  REQUIRE(by_copy.finalize().payload == by_move.finalize().payload);
}

TEST_CASE("finalize and reset leave the assembler empty") {
  ChunkAssembler assembler;
  assembler.observe(data("abc"));
  assembler.observe(params(1, 2));
  (void)assembler.finalize();

  REQUIRE(assembler.buffered_bytes() == 0);
  REQUIRE_FALSE(assembler.is_ready());

  assembler.observe(data("zzz"));
  assembler.reset();
  REQUIRE(assembler.buffered_bytes() == 0);
  REQUIRE_THROWS_AS(assembler.finalize(), MissingParametersError);
}
