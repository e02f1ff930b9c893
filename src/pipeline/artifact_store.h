// VBIN - artifact_store.h
// Stable names and atomic persistence for every stage output

#pragma once

#include "types.h"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace vbin {

enum class ArtifactKind {
    Features,
    Coverage,
    Embedding,
    ModelCheckpoint,
    ClusterReport,
    RunLog,
};

struct ArtifactHandle {
    ArtifactKind kind;
    std::filesystem::path path;
    std::string format;  // "tsv", "torch", "text"
};

// A matrix artifact read back from disk
struct MatrixArtifact {
    std::vector<std::string> row_labels;
    std::vector<std::string> column_labels;
    Matrix values;
};

// Creates the output directory and removes it again on destruction unless
// keep() was called. Covers failures between validation and the first stage.
class ScopedOutputDirectory {
public:
    explicit ScopedOutputDirectory(const std::filesystem::path& dir);
    ~ScopedOutputDirectory();

    ScopedOutputDirectory(const ScopedOutputDirectory&) = delete;
    ScopedOutputDirectory& operator=(const ScopedOutputDirectory&) = delete;

    const std::filesystem::path& path() const { return dir_; }
    void keep() { keep_ = true; }

private:
    std::filesystem::path dir_;
    bool keep_ = false;
};

class ArtifactStore {
public:
    using Writer = std::function<void(const std::filesystem::path&)>;

    explicit ArtifactStore(std::filesystem::path root);

    static const char* file_name(ArtifactKind kind);
    static const char* format_of(ArtifactKind kind);
    static const char* label_of(ArtifactKind kind);

    const std::filesystem::path& root() const { return root_; }

    // Final location of an artifact, for collaborators that stream their own
    // format (the run log)
    std::filesystem::path path_for(ArtifactKind kind) const;

    // Runs writer against a temporary path, syncs it and renames it into
    // place. If writer throws, the temporary file is removed and the error
    // propagates; the final name never holds a partial artifact.
    ArtifactHandle commit(ArtifactKind kind, const Writer& writer);

    // Writes a labelled matrix as TSV. column_prefix names the columns
    // ("tnf_" -> tnf_0, tnf_1, ...).
    ArtifactHandle put(ArtifactKind kind, const Matrix& values,
                       const std::vector<std::string>& row_labels,
                       const std::string& column_prefix);

    static MatrixArtifact read_matrix(const ArtifactHandle& handle);

private:
    std::filesystem::path root_;
};

}  // namespace vbin
