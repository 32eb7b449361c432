#include <catch2/catch_test_macros.hpp>
#include "peerlink/io/file_streams.hpp"
#include "peerlink/io/memory_streams.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "helpers/temp_directory.hpp"
#include "helpers/test_vectors.hpp"
#include <fstream>
#include <iterator>

using namespace peerlink::transfer;
using namespace peerlink::transfer::io;
using peerlink::transfer::test_helpers::PatternBytes;
using peerlink::transfer::test_helpers::ReadFile;
using peerlink::transfer::test_helpers::TempDirectory;

TEST_CASE("MemoryByteSource - Reads in blocks", "[io]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto data = PatternBytes(10);
    MemoryByteSource source(data);
    REQUIRE(source.TotalSize() == 10u);
    REQUIRE(source.Read(4).Unwrap().size() == 4);
    REQUIRE(source.Read(4).Unwrap().size() == 4);
    auto tail = source.Read(4).Unwrap();
    REQUIRE(tail == std::vector<uint8_t>(data.begin() + 8, data.end()));
    REQUIRE(source.Read(4).Unwrap().empty());
    REQUIRE(source.Read(0).IsErr());
}

TEST_CASE("MemoryByteSink - Commit and discard", "[io]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    MemoryByteSink sink;
    REQUIRE(sink.Write(std::vector<uint8_t>{1, 2}).IsOk());
    REQUIRE(sink.Write(std::vector<uint8_t>{3}).IsOk());

    SECTION("Contents require a commit") {
        REQUIRE(sink.Contents().IsErr());
        REQUIRE(sink.Commit().IsOk());
        REQUIRE(sink.Contents().Unwrap() == std::vector<uint8_t>{1, 2, 3});
        REQUIRE(sink.Write(std::vector<uint8_t>{4}).IsErr());
    }
    SECTION("Discarded data is gone") {
        sink.Discard();
        REQUIRE(sink.IsDiscarded());
        REQUIRE(sink.Commit().IsErr());
        REQUIRE(sink.Contents().IsErr());
    }
}

TEST_CASE("FileByteSource - Reads a file", "[io][file]") {
    TempDirectory dir;
    const auto path = dir.Path() / "input.bin";
    const auto data = PatternBytes(5000, 3);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    auto source = FileByteSource::Open(path);
    REQUIRE(source.IsOk());
    REQUIRE(source.Unwrap()->TotalSize() == 5000u);
    std::vector<uint8_t> collected;
    while (true) {
        auto block = source.Unwrap()->Read(4096).Unwrap();
        if (block.empty()) {
            break;
        }
        collected.insert(collected.end(), block.begin(), block.end());
    }
    REQUIRE(collected == data);
    REQUIRE(FileByteSource::Open(dir.Path() / "missing.bin").IsErr());
}

TEST_CASE("AtomicFileSink - Output appears only on commit", "[io][file]") {
    TempDirectory dir;
    const auto destination = dir.Path() / "output.bin";
    const auto partial = AtomicFileSink::PartialPathFor(destination);

    SECTION("Commit renames the partial file") {
        auto sink = AtomicFileSink::Create(destination).Unwrap();
        REQUIRE(sink->Write(std::vector<uint8_t>{7, 8, 9}).IsOk());
        REQUIRE(std::filesystem::exists(partial));
        REQUIRE_FALSE(std::filesystem::exists(destination));
        REQUIRE(sink->Commit().IsOk());
        REQUIRE(sink->IsCommitted());
        REQUIRE_FALSE(std::filesystem::exists(partial));
        REQUIRE(ReadFile(destination) == std::vector<uint8_t>{7, 8, 9});
    }
    SECTION("Discard removes the partial file") {
        auto sink = AtomicFileSink::Create(destination).Unwrap();
        REQUIRE(sink->Write(std::vector<uint8_t>{1}).IsOk());
        sink->Discard();
        REQUIRE_FALSE(std::filesystem::exists(partial));
        REQUIRE_FALSE(std::filesystem::exists(destination));
        REQUIRE(sink->Write(std::vector<uint8_t>{2}).IsErr());
    }
    SECTION("Destruction without commit leaves nothing behind") {
        {
            auto sink = AtomicFileSink::Create(destination).Unwrap();
            REQUIRE(sink->Write(std::vector<uint8_t>{1, 2, 3}).IsOk());
        }
        REQUIRE_FALSE(std::filesystem::exists(partial));
        REQUIRE_FALSE(std::filesystem::exists(destination));
    }
    SECTION("Unwritable location") {
        REQUIRE(AtomicFileSink::Create(dir.Path() / "no-such-dir" / "out.bin").IsErr());
    }
}
