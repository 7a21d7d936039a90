#include "catch2/catch.hpp"

#include <stdexcept>

#include "stream/chunk_emitter.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using edge_stream::ChunkEmitter;

static std::vector<std::string> drain(ChunkEmitter &emitter) {
  std::vector<std::string> out;
  OutputChunk chunk;
  while (emitter.next(chunk)) {
    out.push_back(str(chunk.content));
  }
  return out;
}

TEST_CASE("short final chunk") {
  ChunkEmitter emitter(bytes("AAAABBBB"), 3);
  REQUIRE(emitter.chunk_count() == 3);
  REQUIRE(drain(emitter) == std::vector<std::string>{"AAA", "ABB", "BB"});
  REQUIRE(emitter.exhausted());
}

TEST_CASE("evenly divisible payload ends with a full chunk") {
  ChunkEmitter emitter(bytes("abcdef"), 2);
  REQUIRE(drain(emitter) == std::vector<std::string>{"ab", "cd", "ef"});
}

TEST_CASE("empty payload produces no chunks") {
  ChunkEmitter emitter(Bytes{}, 2048);
  REQUIRE(emitter.chunk_count() == 0);
  REQUIRE(emitter.exhausted());
  OutputChunk chunk;
  REQUIRE_FALSE(emitter.next(chunk));
}

TEST_CASE("payload smaller than chunk size is one chunk") {
  ChunkEmitter emitter(bytes("xyz"));
  REQUIRE(emitter.max_chunk_size() == edge_stream::kDefaultChunkSize);
  REQUIRE(drain(emitter) == std::vector<std::string>{"xyz"});
}

TEST_CASE("chunk count and reassembly for assorted sizes") {
  const size_t sizes[] = {1, 2047, 2048, 2049, 4096, 5000};
  for (size_t len : sizes) {
    Bytes payload(len);
    for (size_t i = 0; i < len; ++i) {
      payload[i] = static_cast<uint8_t>(i * 31 + 7);
    }

    ChunkEmitter emitter(payload, 2048);
    Bytes joined;
    size_t count = 0;
    OutputChunk chunk;
    while (emitter.next(chunk)) {
      REQUIRE(chunk.content.size() <= 2048);
      REQUIRE_FALSE(chunk.content.empty());
      joined.insert(joined.end(), chunk.content.begin(), chunk.content.end());
      ++count;
    }

    INFO("payload length " << len);
    REQUIRE(count == (len + 2047) / 2048);
    REQUIRE(emitter.chunks_emitted() == count);
    REQUIRE(joined == payload);
  }
}

TEST_CASE("a new emitter over the same payload starts over") {
  const Bytes payload = bytes("restart");
  ChunkEmitter first(payload, 4);
  OutputChunk chunk;
  REQUIRE(first.next(chunk));

  ChunkEmitter second(payload, 4);
  REQUIRE(drain(second) == std::vector<std::string>{"rest", "art"});
}

TEST_CASE("zero chunk size is rejected") {
  REQUIRE_THROWS_AS(ChunkEmitter(bytes("x"), 0), std::invalid_argument);
}
