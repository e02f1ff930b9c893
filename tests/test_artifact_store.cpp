// VBIN - test_artifact_store.cpp

#include "test_utils.h"
#include "pipeline/artifact_store.h"
#include "pipeline/errors.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace vbin;
using namespace vbin::test;

TEST_CASE("artifact names are stable", "[artifacts]") {
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::Features)) == "tnf.tsv");
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::Coverage)) == "rpkm.tsv");
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::Embedding)) == "latent.tsv");
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::ModelCheckpoint)) == "model.pt");
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::ClusterReport)) == "clusters.tsv");
    CHECK(std::string(ArtifactStore::file_name(ArtifactKind::RunLog)) == "log.txt");

    TempDir dir;
    ArtifactStore store(dir.path());
    CHECK(store.path_for(ArtifactKind::ClusterReport) == dir.path() / "clusters.tsv");
    CHECK(std::string(ArtifactStore::format_of(ArtifactKind::ModelCheckpoint)) == "torch");
}

TEST_CASE("put writes a labelled matrix that reads back", "[artifacts]") {
    TempDir dir;
    ArtifactStore store(dir.path());

    Matrix m(3, 2);
    m << 0.125f, 1.5f,
         2.0f, -3.25f,
         0.0f, 1e-4f;
    ArtifactHandle handle = store.put(ArtifactKind::Coverage, m, {"a", "b", "c"}, "sample_");

    CHECK(handle.kind == ArtifactKind::Coverage);
    CHECK(handle.path == dir.path() / "rpkm.tsv");
    CHECK(handle.format == "tsv");
    CHECK_FALSE(fs::exists(dir / "rpkm.tsv.tmp"));

    auto lines = read_lines(handle.path);
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "contig\tsample_0\tsample_1");

    MatrixArtifact back = ArtifactStore::read_matrix(handle);
    CHECK(back.row_labels == std::vector<std::string>{"a", "b", "c"});
    CHECK(back.column_labels == std::vector<std::string>{"sample_0", "sample_1"});
    REQUIRE(back.values.rows() == 3);
    REQUIRE(back.values.cols() == 2);
    CHECK(back.values(1, 1) == Catch::Approx(-3.25f));
    CHECK(back.values(2, 1) == Catch::Approx(1e-4f));
}

TEST_CASE("put rejects a label count that differs from the rows", "[artifacts]") {
    TempDir dir;
    ArtifactStore store(dir.path());
    Matrix m = Matrix::Zero(2, 2);

    CHECK_THROWS_AS(store.put(ArtifactKind::Features, m, {"only_one"}, "tnf_"),
                    std::invalid_argument);
    CHECK_FALSE(fs::exists(dir / "tnf.tsv"));
}

TEST_CASE("a failing writer leaves no artifact behind", "[artifacts]") {
    TempDir dir;
    ArtifactStore store(dir.path());

    auto failing = [](const fs::path& path) {
        write_text(path, "partial");
        throw std::runtime_error("disk full");
    };
    CHECK_THROWS_WITH(store.commit(ArtifactKind::ClusterReport, failing), "disk full");
    CHECK_FALSE(fs::exists(dir / "clusters.tsv"));
    CHECK_FALSE(fs::exists(dir / "clusters.tsv.tmp"));
}

TEST_CASE("a writer that produces nothing is an error", "[artifacts]") {
    TempDir dir;
    ArtifactStore store(dir.path());

    CHECK_THROWS_AS(store.commit(ArtifactKind::ModelCheckpoint, [](const fs::path&) {}),
                    std::runtime_error);
    CHECK_FALSE(fs::exists(dir / "model.pt"));
}

TEST_CASE("commit publishes under the final name only when complete", "[artifacts]") {
    TempDir dir;
    ArtifactStore store(dir.path());

    ArtifactHandle handle = store.commit(ArtifactKind::ClusterReport, [&](const fs::path& p) {
        CHECK(p.filename() == "clusters.tsv.tmp");
        CHECK_FALSE(fs::exists(dir / "clusters.tsv"));
        write_text(p, "cluster_1\tc1\n");
    });

    CHECK(handle.path == dir.path() / "clusters.tsv");
    CHECK(read_text(handle.path) == "cluster_1\tc1\n");
    CHECK_FALSE(fs::exists(dir / "clusters.tsv.tmp"));
}

TEST_CASE("read_matrix rejects ragged rows", "[artifacts]") {
    TempDir dir;
    write_text(dir / "tnf.tsv", "contig\ttnf_0\ttnf_1\nc1\t0.5\n");
    ArtifactHandle handle{ArtifactKind::Features, dir / "tnf.tsv", "tsv"};

    CHECK_THROWS_AS(ArtifactStore::read_matrix(handle), std::runtime_error);
}

TEST_CASE("scoped output directory", "[artifacts]") {
    TempDir dir;
    const fs::path out = dir / "run";

    SECTION("removed on scope exit unless kept") {
        {
            ScopedOutputDirectory scoped(out);
            CHECK(fs::is_directory(out));
            write_text(out / "log.txt", "x");
        }
        CHECK_FALSE(fs::exists(out));
    }

    SECTION("kept directories survive") {
        {
            ScopedOutputDirectory scoped(out);
            scoped.keep();
        }
        CHECK(fs::is_directory(out));
    }

    SECTION("an existing entry is a conflict and is left alone") {
        fs::create_directory(out);
        write_text(out / "keep.txt", "mine");
        CHECK_THROWS_AS(ScopedOutputDirectory(out), PathConflict);
        CHECK(read_text(out / "keep.txt") == "mine");
    }

    SECTION("missing parent") {
        CHECK_THROWS_AS(ScopedOutputDirectory(dir / "a" / "b"), PathNotFound);
    }
}
